#pragma once

#include "Clock.h"
#include "Config.h"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace BehaviorSentinel {

    enum class RiskLevel {
        LOW,
        MEDIUM,
        HIGH
    };

    const char* riskLevelToString(RiskLevel level);

    struct FusionResult {
        double finalScore{0.0};
        RiskLevel riskLevel{RiskLevel::LOW};
        std::vector<std::string> explanations;
        int64_t timestampMs{0};
    };

    /**
     * @brief Combines up to three optional agent scores into one risk verdict
     *
     * finalScore = sum(w_i * s_i * 10) / sum(w_i) over the present scores, so it
     * ranges over [0,10] rather than [0,1]. Risk: <= 0.40 LOW, <= 0.70 MEDIUM,
     * otherwise HIGH. Weights are always normalized to sum to 1.
     */
    class FusionEngine {
    public:
        static constexpr double LOW_THRESHOLD = 0.40;
        static constexpr double HIGH_THRESHOLD = 0.70;
        static constexpr double SCORE_SCALE = 10.0;

        struct Weights {
            double touch{0.5};
            double typing{0.3};
            double usage{0.2};

            static Weights fromConfig(const Config& config);
        };

        FusionEngine();
        explicit FusionEngine(Weights weights, Clock clock = systemClock());

        FusionResult fuseScores(std::optional<double> touch,
                                std::optional<double> typing,
                                std::optional<double> usage) const;

        void updateWeights(double touch, double typing, double usage);

        double getTouchWeight() const;
        double getTypingWeight() const;
        double getUsageWeight() const;

        static RiskLevel determineRiskLevel(double score);
        static std::string toJson(const FusionResult& result);

    private:
        static Weights normalized(Weights weights);

        mutable std::mutex mutex_;
        Weights weights_;
        Clock clock_;
    };

}
