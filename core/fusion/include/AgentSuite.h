#pragma once

#include "Clock.h"
#include "Config.h"
#include "FusionEngine.h"
#include "IExternalScorer.h"
#include "ResponsePolicy.h"
#include "ScoreReporter.h"
#include "TouchAgent.h"
#include "TypingAgent.h"
#include "UsageAgent.h"
#include <memory>
#include <optional>
#include <string>

namespace BehaviorSentinel {

    class BaselineStore;

    struct SuiteVerdict {
        AgentResult touch;
        AgentResult typing;
        AgentResult usage;
        FusionResult fusion;
        AlertDecision alert;
        std::optional<ExternalScoreResult> external;   // auxiliary, never fused
    };

    /**
     * @brief Owns the three agents and drives fusion, reporting and the response policy
     *
     * An agent contributes to fusion only while it is active.
     */
    class AgentSuite {
    public:
        struct Settings {
            TouchAgent::Settings touch;
            TypingAgent::Settings typing;
            UsageAgent::Settings usage;
            FusionEngine::Weights weights;
            ResponsePolicy::Settings response;

            static Settings fromConfig(const Config& config);
        };

        AgentSuite();
        explicit AgentSuite(const Settings& settings, Clock clock = systemClock());

        AgentSuite(const AgentSuite&) = delete;
        AgentSuite& operator=(const AgentSuite&) = delete;

        TouchAgent& touch() { return touch_; }
        TypingAgent& typing() { return typing_; }
        UsageAgent& usage() { return usage_; }
        FusionEngine& fusion() { return fusion_; }
        ResponsePolicy& policy() { return policy_; }
        ScoreReporter& reporter() { return reporter_; }

        void startAll();
        void stopAll();

        /**
         * @brief Record every verdict in store's score_logs; nullptr detaches
         */
        void attachStore(BaselineStore* store) { store_ = store; }
        void setExternalScorer(std::shared_ptr<IExternalScorer> scorer) { externalScorer_ = std::move(scorer); }

        Result<void> saveState(BaselineStore& store);

        /**
         * @brief Restore every agent that has a stored record
         * @return Number of agents restored; missing or malformed records are skipped
         */
        size_t loadState(BaselineStore& store);

        /**
         * @param context Free-text detail attached to the response-action log entry
         */
        SuiteVerdict evaluate(const std::string& context = "");

    private:
        std::optional<ExternalScoreResult> scoreExternally();

        Clock clock_;
        TouchAgent touch_;
        TypingAgent typing_;
        UsageAgent usage_;
        FusionEngine fusion_;
        ResponsePolicy policy_;
        ScoreReporter reporter_;
        BaselineStore* store_ = nullptr;
        std::shared_ptr<IExternalScorer> externalScorer_;
    };

}
