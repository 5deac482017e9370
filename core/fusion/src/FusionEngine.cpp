#include "FusionEngine.h"
#include <cstdio>
#include <sstream>

namespace BehaviorSentinel {

    namespace {

        void addScoreExplanation(std::vector<std::string>& out, const std::string& agent, double score) {
            if (score > 0.7) {
                out.push_back(agent + " high anomaly");
            } else if (score > 0.4) {
                out.push_back(agent + " moderate anomaly");
            } else {
                out.push_back(agent + " normal");
            }
        }

        std::string fusionStrategy(bool touch, bool typing, bool usage) {
            std::string names;
            int count = 0;
            auto append = [&](bool present, const char* name) {
                if (!present) return;
                if (count > 0) names += '+';
                names += name;
                ++count;
            };
            append(touch, "touch");
            append(typing, "typing");
            append(usage, "usage");

            if (count == 1) return names + "-only fusion";
            if (count == 2) return names + " dual fusion";
            return names + " triple fusion";
        }

        const char* riskExplanation(RiskLevel level) {
            switch (level) {
                case RiskLevel::LOW: return "risk score within normal range";
                case RiskLevel::MEDIUM: return "elevated risk requires verification";
                case RiskLevel::HIGH: return "high risk requires immediate action";
            }
            return "";
        }

    }

    const char* riskLevelToString(RiskLevel level) {
        switch (level) {
            case RiskLevel::LOW: return "LOW";
            case RiskLevel::MEDIUM: return "MEDIUM";
            case RiskLevel::HIGH: return "HIGH";
        }
        return "UNKNOWN";
    }

    FusionEngine::Weights FusionEngine::Weights::fromConfig(const Config& config) {
        Weights w;
        w.touch = config.getDouble("fusion.weight.touch", w.touch);
        w.typing = config.getDouble("fusion.weight.typing", w.typing);
        w.usage = config.getDouble("fusion.weight.usage", w.usage);
        return w;
    }

    FusionEngine::FusionEngine() : FusionEngine(Weights{}) {}

    FusionEngine::FusionEngine(Weights weights, Clock clock)
        : weights_(normalized(weights)),
          clock_(clock ? std::move(clock) : systemClock()) {
    }

    FusionEngine::Weights FusionEngine::normalized(Weights weights) {
        double total = weights.touch + weights.typing + weights.usage;
        if (total > 0) {
            weights.touch /= total;
            weights.typing /= total;
            weights.usage /= total;
        }
        return weights;
    }

    void FusionEngine::updateWeights(double touch, double typing, double usage) {
        std::lock_guard<std::mutex> lock(mutex_);
        weights_ = normalized(Weights{touch, typing, usage});
    }

    double FusionEngine::getTouchWeight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return weights_.touch;
    }

    double FusionEngine::getTypingWeight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return weights_.typing;
    }

    double FusionEngine::getUsageWeight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return weights_.usage;
    }

    FusionResult FusionEngine::fuseScores(std::optional<double> touch,
                                          std::optional<double> typing,
                                          std::optional<double> usage) const {
        Weights w;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            w = weights_;
        }

        FusionResult result;
        result.timestampMs = clock_();

        if (!touch && !typing && !usage) {
            result.explanations.emplace_back("no signals available");
            return result;
        }

        double numerator = 0.0;
        double totalWeight = 0.0;
        if (touch) {
            numerator += w.touch * *touch * SCORE_SCALE;
            totalWeight += w.touch;
            addScoreExplanation(result.explanations, "touch", *touch);
        }
        if (typing) {
            numerator += w.typing * *typing * SCORE_SCALE;
            totalWeight += w.typing;
            addScoreExplanation(result.explanations, "typing", *typing);
        }
        if (usage) {
            numerator += w.usage * *usage * SCORE_SCALE;
            totalWeight += w.usage;
            addScoreExplanation(result.explanations, "usage", *usage);
        }

        result.finalScore = totalWeight > 0 ? numerator / totalWeight : numerator;
        result.explanations.push_back(fusionStrategy(touch.has_value(), typing.has_value(), usage.has_value()));
        result.riskLevel = determineRiskLevel(result.finalScore);
        result.explanations.emplace_back(riskExplanation(result.riskLevel));
        return result;
    }

    RiskLevel FusionEngine::determineRiskLevel(double score) {
        if (score <= LOW_THRESHOLD) return RiskLevel::LOW;
        if (score <= HIGH_THRESHOLD) return RiskLevel::MEDIUM;
        return RiskLevel::HIGH;
    }

    std::string FusionEngine::toJson(const FusionResult& result) {
        char score[32];
        std::snprintf(score, sizeof(score), "%.2f", result.finalScore);

        std::ostringstream json;
        json << "{\n";
        json << "  \"final_score\": " << score << ",\n";
        json << "  \"risk_level\": \"" << riskLevelToString(result.riskLevel) << "\",\n";
        json << "  \"timestamp\": " << result.timestampMs << ",\n";
        json << "  \"explanations\": [";
        for (size_t i = 0; i < result.explanations.size(); ++i) {
            if (i > 0) json << ", ";
            json << '"' << result.explanations[i] << '"';
        }
        json << "]\n}";
        return json.str();
    }

}
