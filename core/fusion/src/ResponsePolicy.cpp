#include "ResponsePolicy.h"
#include "LoggerMacros.h"

namespace BehaviorSentinel {

    ResponsePolicy::Settings ResponsePolicy::Settings::fromConfig(const Config& config) {
        Settings s;
        s.minAlertIntervalMs = static_cast<int64_t>(
            config.getSize("response.min_alert_interval_ms", static_cast<size_t>(s.minAlertIntervalMs)));
        s.minScoreDelta = config.getDouble("response.min_score_delta", s.minScoreDelta);
        return s;
    }

    ResponsePolicy::ResponsePolicy() : ResponsePolicy(Settings{}) {}

    ResponsePolicy::ResponsePolicy(Settings settings, Clock clock)
        : settings_(settings),
          clock_(clock ? std::move(clock) : systemClock()) {
    }

    const char* ResponsePolicy::actionFor(RiskLevel level) {
        switch (level) {
            case RiskLevel::LOW: return "Continue normal operation";
            case RiskLevel::MEDIUM: return "Request biometric verification";
            case RiskLevel::HIGH: return "Lock account and alert security team";
        }
        return "Unknown risk level";
    }

    AlertDecision ResponsePolicy::evaluate(const FusionResult& result) {
        AlertDecision decision;
        decision.riskLevel = result.riskLevel;
        decision.action = actionFor(result.riskLevel);

        std::lock_guard<std::mutex> lock(mutex_);
        if (result.riskLevel == RiskLevel::LOW) {
            lastAlertLevel_.reset();
            return decision;
        }

        int64_t now = clock_();
        bool intervalOk = !lastAlertMs_ || now - *lastAlertMs_ >= settings_.minAlertIntervalMs;
        bool levelChanged = lastAlertLevel_ != result.riskLevel;
        bool scoreJumped = result.finalScore - lastAlertScore_ >= settings_.minScoreDelta;
        if (!(levelChanged || scoreJumped) || !intervalOk) {
            LOG_DEBUG_COMP_IF(std::string("alert suppressed at ") + riskLevelToString(result.riskLevel),
                              "ResponsePolicy");
            return decision;
        }

        lastAlertLevel_ = result.riskLevel;
        lastAlertMs_ = now;
        lastAlertScore_ = result.finalScore;
        decision.shouldAlert = true;
        return decision;
    }

    void ResponsePolicy::reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        lastAlertLevel_.reset();
        lastAlertMs_.reset();
        lastAlertScore_ = 0.0;
    }

}
