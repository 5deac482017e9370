#pragma once

#include "Result.h"
#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace BehaviorSentinel {

    /**
     * @brief Score snapshot produced by an agent
     *
     * The score is clamped to [0,1] on construction. Explanations keep
     * detection order.
     */
    class AgentResult {
    public:
        AgentResult(double score, std::vector<std::string> explanations, int64_t timestampMs)
            : score_(std::max(0.0, std::min(1.0, score))),
              explanations_(std::move(explanations)),
              timestampMs_(timestampMs) {}

        double score() const { return score_; }
        const std::vector<std::string>& explanations() const { return explanations_; }
        int64_t timestampMs() const { return timestampMs_; }

    private:
        double score_;
        std::vector<std::string> explanations_;
        int64_t timestampMs_;
    };

    class IAgent {
    public:
        virtual ~IAgent() = default;

        /**
         * @brief Begin accepting events. Events delivered while inactive are ignored.
         */
        virtual void start() = 0;

        /**
         * @brief Stop accepting events and drop recent windows; baselines are kept.
         */
        virtual void stop() = 0;

        /**
         * @brief Current anomaly score and explanations. Does not mutate state.
         */
        virtual AgentResult getResult() const = 0;

        /**
         * @brief Forget the learned baseline and re-enter warmup.
         */
        virtual void resetBaseline() = 0;

        virtual bool isActive() const = 0;
        virtual std::string getName() const = 0;

        /**
         * @brief Baseline state as a version-tagged text record
         */
        virtual std::string exportState() const = 0;

        /**
         * @brief Decode a record produced by exportState() and apply it
         * @return ParseError when the record is malformed; state is left untouched
         */
        virtual Result<void> importState(const std::string& encoded) = 0;
    };

}
