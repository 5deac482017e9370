#pragma once

#include "Clock.h"
#include "Config.h"
#include "FusionEngine.h"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace BehaviorSentinel {

    struct AlertDecision {
        bool shouldAlert{false};
        RiskLevel riskLevel{RiskLevel::LOW};
        std::string action;
    };

    /**
     * @brief Maps risk levels to actions and throttles repeated alerts
     *
     * Only MEDIUM and HIGH verdicts alert. An alert fires when the level changed
     * or the score rose by minScoreDelta since the last alert, and at least
     * minAlertIntervalMs has passed. A LOW verdict forgets the last alerted level.
     */
    class ResponsePolicy {
    public:
        struct Settings {
            int64_t minAlertIntervalMs{60000};
            double minScoreDelta{0.10};

            static Settings fromConfig(const Config& config);
        };

        ResponsePolicy();
        explicit ResponsePolicy(Settings settings, Clock clock = systemClock());

        static const char* actionFor(RiskLevel level);

        AlertDecision evaluate(const FusionResult& result);

        void reset();

    private:
        std::mutex mutex_;
        Settings settings_;
        Clock clock_;

        std::optional<RiskLevel> lastAlertLevel_;
        std::optional<int64_t> lastAlertMs_;
        double lastAlertScore_{0.0};
    };

}
