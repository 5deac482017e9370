#pragma once

#include <map>
#include <utility>
#include <string>

namespace BehaviorSentinel {

    /// Named numeric features handed to an external model
    using FeatureMap = std::map<std::string, double>;

    /**
     * @brief Outcome of one external scoring call
     *
     * ok=false carries the failure in error; score, mse and threshold are
     * meaningful only when ok is true.
     */
    struct ExternalScoreResult {
        bool ok{false};
        double score{0.0};
        double mse{0.0};
        double threshold{0.0};
        std::string error;

        static ExternalScoreResult failure(std::string message) {
            ExternalScoreResult r;
            r.error = std::move(message);
            return r;
        }
    };

    /**
     * @brief Auxiliary scorer backed by an out-of-process model
     *
     * Implementations must not throw; timeouts and crashes are reported as
     * ok=false.
     */
    class IExternalScorer {
    public:
        virtual ~IExternalScorer() = default;
        virtual ExternalScoreResult score(const FeatureMap& features) = 0;
        virtual std::string getName() const = 0;
    };

}
