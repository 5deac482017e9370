#pragma once

#include "IAgent.h"
#include "FusionEngine.h"
#include "Result.h"
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace BehaviorSentinel {

    /**
     * @brief Structured score logging through Logger, plus an optional CSV trail
     *
     * Entries go out at INFO under the AGENT_RESULT, FUSION_RESULT and
     * RESPONSE_ACTION components.
     */
    class ScoreReporter {
    public:
        static constexpr const char* CSV_HEADER = "timestamp,touch,typing,usage,final_score,risk_level,explanations";

        ScoreReporter() = default;

        /**
         * @brief Append one row per fused verdict to path; writes the header for a new file
         */
        Result<void> enableCsv(const std::string& path);
        void disableCsv();

        void logAgentResult(const std::string& agentName, const AgentResult& result);
        void logFusionResult(const FusionResult& result,
                             std::optional<double> touch,
                             std::optional<double> typing,
                             std::optional<double> usage);
        void logResponseAction(RiskLevel level, const std::string& action, const std::string& details);

        static std::string formatAgentResult(const std::string& agentName, const AgentResult& result);
        static std::string formatFusionResult(const FusionResult& result,
                                              std::optional<double> touch,
                                              std::optional<double> typing,
                                              std::optional<double> usage);
        static std::string formatResponseAction(RiskLevel level, const std::string& action, const std::string& details);

    private:
        std::mutex csvMutex_;
        std::ofstream csv_;
    };

}
