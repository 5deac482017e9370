#include "ScoreReporter.h"
#include "Logger.h"
#include <cstdio>
#include <filesystem>

namespace BehaviorSentinel {

    namespace {

        std::string format3(double value) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.3f", value);
            return buf;
        }

        std::string formatScore(std::optional<double> score) {
            return score ? format3(*score) : "null";
        }

        std::string joinExplanations(const std::vector<std::string>& items, const char* separator) {
            std::string out;
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) out += separator;
                out += items[i];
            }
            return out;
        }

        // Quoted CSV field; embedded quotes are doubled.
        std::string csvQuoted(const std::string& value) {
            std::string out = "\"";
            for (char c : value) {
                if (c == '"') out += '"';
                out += c;
            }
            out += '"';
            return out;
        }

    }

    Result<void> ScoreReporter::enableCsv(const std::string& path) {
        std::error_code ec;
        bool fresh = !std::filesystem::exists(path, ec) || std::filesystem::file_size(path, ec) == 0;

        std::lock_guard<std::mutex> lock(csvMutex_);
        if (csv_.is_open()) {
            csv_.close();
        }
        csv_.open(path, std::ios::app);
        if (!csv_.is_open()) {
            return Err(ErrorCode::FileWriteError, "cannot open score CSV: " + path);
        }
        if (fresh) {
            csv_ << CSV_HEADER << '\n';
            csv_.flush();
        }
        return Ok();
    }

    void ScoreReporter::disableCsv() {
        std::lock_guard<std::mutex> lock(csvMutex_);
        if (csv_.is_open()) {
            csv_.close();
        }
    }

    std::string ScoreReporter::formatAgentResult(const std::string& agentName, const AgentResult& result) {
        return "Agent=" + agentName +
               ", Score=" + format3(result.score()) +
               ", Explanations=" + joinExplanations(result.explanations(), "; ") +
               ", Timestamp=" + std::to_string(result.timestampMs());
    }

    std::string ScoreReporter::formatFusionResult(const FusionResult& result,
                                                  std::optional<double> touch,
                                                  std::optional<double> typing,
                                                  std::optional<double> usage) {
        return "FinalScore=" + format3(result.finalScore) +
               ", RiskLevel=" + riskLevelToString(result.riskLevel) +
               ", TouchScore=" + formatScore(touch) +
               ", TypingScore=" + formatScore(typing) +
               ", UsageScore=" + formatScore(usage) +
               ", Explanations=" + joinExplanations(result.explanations, "; ");
    }

    std::string ScoreReporter::formatResponseAction(RiskLevel level, const std::string& action,
                                                    const std::string& details) {
        return std::string("RiskLevel=") + riskLevelToString(level) + ", Action=" + action + ", Details=" + details;
    }

    void ScoreReporter::logAgentResult(const std::string& agentName, const AgentResult& result) {
        auto& logger = Logger::instance();
        if (!logger.isInfoEnabled()) return;
        logger.info(formatAgentResult(agentName, result), "AGENT_RESULT");
    }

    void ScoreReporter::logFusionResult(const FusionResult& result,
                                        std::optional<double> touch,
                                        std::optional<double> typing,
                                        std::optional<double> usage) {
        auto& logger = Logger::instance();
        if (logger.isInfoEnabled()) {
            logger.info(formatFusionResult(result, touch, typing, usage), "FUSION_RESULT");
        }

        std::lock_guard<std::mutex> lock(csvMutex_);
        if (!csv_.is_open()) return;

        csv_ << result.timestampMs << ','
             << formatScore(touch) << ','
             << formatScore(typing) << ','
             << formatScore(usage) << ','
             << format3(result.finalScore) << ','
             << riskLevelToString(result.riskLevel) << ','
             << csvQuoted(joinExplanations(result.explanations, "|")) << '\n';
        csv_.flush();
        if (!csv_) {
            logger.error("failed to append score CSV row", "ScoreReporter");
            csv_.clear();
        }
    }

    void ScoreReporter::logResponseAction(RiskLevel level, const std::string& action, const std::string& details) {
        auto& logger = Logger::instance();
        if (!logger.isInfoEnabled()) return;
        logger.info(formatResponseAction(level, action, details), "RESPONSE_ACTION");
    }

}
