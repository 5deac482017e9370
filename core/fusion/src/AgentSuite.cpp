#include "AgentSuite.h"
#include "BaselineStore.h"
#include "LoggerMacros.h"
#include <exception>

namespace BehaviorSentinel {

    namespace {

        std::optional<double> scoreIfActive(const IAgent& agent, const AgentResult& result) {
            if (!agent.isActive()) return std::nullopt;
            return result.score();
        }

    }

    AgentSuite::Settings AgentSuite::Settings::fromConfig(const Config& config) {
        Settings s;
        s.touch = TouchAgent::Settings::fromConfig(config);
        s.typing = TypingAgent::Settings::fromConfig(config);
        s.usage = UsageAgent::Settings::fromConfig(config);
        s.weights = FusionEngine::Weights::fromConfig(config);
        s.response = ResponsePolicy::Settings::fromConfig(config);
        return s;
    }

    AgentSuite::AgentSuite() : AgentSuite(Settings{}) {}

    AgentSuite::AgentSuite(const Settings& settings, Clock clock)
        : clock_(clock ? std::move(clock) : systemClock()),
          touch_(settings.touch, clock_),
          typing_(settings.typing, clock_),
          usage_(settings.usage, clock_),
          fusion_(settings.weights, clock_),
          policy_(settings.response, clock_) {
    }

    void AgentSuite::startAll() {
        touch_.start();
        typing_.start();
        usage_.start();
    }

    void AgentSuite::stopAll() {
        touch_.stop();
        typing_.stop();
        usage_.stop();
    }

    Result<void> AgentSuite::saveState(BaselineStore& store) {
        int64_t now = clock_();
        for (IAgent* agent : {static_cast<IAgent*>(&touch_), static_cast<IAgent*>(&typing_),
                              static_cast<IAgent*>(&usage_)}) {
            auto saved = store.saveState(agent->getName(), agent->exportState(), now);
            if (!saved) {
                LOG_ERROR_COMP("failed to save " + agent->getName() + " state: " + saved.error().message, "AgentSuite");
                return saved;
            }
        }
        return Ok();
    }

    size_t AgentSuite::loadState(BaselineStore& store) {
        size_t restored = 0;
        for (IAgent* agent : {static_cast<IAgent*>(&touch_), static_cast<IAgent*>(&typing_),
                              static_cast<IAgent*>(&usage_)}) {
            auto encoded = store.loadState(agent->getName());
            if (!encoded) {
                if (encoded.error().code != ErrorCode::NotFound) {
                    LOG_WARN_COMP("cannot read " + agent->getName() + " state: " + encoded.error().message, "AgentSuite");
                }
                continue;
            }
            auto applied = agent->importState(*encoded);
            if (!applied) {
                LOG_WARN_COMP("skipping malformed " + agent->getName() + " state: " + applied.error().message,
                              "AgentSuite");
                continue;
            }
            ++restored;
        }
        LOG_INFO_COMP_IF("restored state for " + std::to_string(restored) + " agent(s)", "AgentSuite");
        return restored;
    }

    std::optional<ExternalScoreResult> AgentSuite::scoreExternally() {
        if (!externalScorer_) return std::nullopt;

        auto features = touch_.latestFeatures();
        if (!features) return std::nullopt;

        ExternalScoreResult result;
        try {
            result = externalScorer_->score(features->toFeatureMap());
        } catch (const std::exception& e) {
            result = ExternalScoreResult::failure(e.what());
        }
        if (!result.ok) {
            LOG_WARN_COMP(externalScorer_->getName() + " unavailable: " + result.error, "AgentSuite");
            return std::nullopt;
        }
        return result;
    }

    SuiteVerdict AgentSuite::evaluate(const std::string& context) {
        AgentResult touchResult = touch_.getResult();
        AgentResult typingResult = typing_.getResult();
        AgentResult usageResult = usage_.getResult();

        auto touchScore = scoreIfActive(touch_, touchResult);
        auto typingScore = scoreIfActive(typing_, typingResult);
        auto usageScore = scoreIfActive(usage_, usageResult);

        FusionResult fused = fusion_.fuseScores(touchScore, typingScore, usageScore);
        AlertDecision alert = policy_.evaluate(fused);
        // Advisory only: reported in the verdict, never fused.
        auto external = scoreExternally();

        reporter_.logAgentResult(touch_.getName(), touchResult);
        reporter_.logAgentResult(typing_.getName(), typingResult);
        reporter_.logAgentResult(usage_.getName(), usageResult);
        reporter_.logFusionResult(fused, touchScore, typingScore, usageScore);
        if (alert.shouldAlert) {
            reporter_.logResponseAction(alert.riskLevel, alert.action, context);
        }
        if (external) {
            LOG_INFO_COMP_IF("external score " + std::to_string(external->score) +
                             " (mse " + std::to_string(external->mse) +
                             ", threshold " + std::to_string(external->threshold) + ")", "AgentSuite");
        }

        if (store_) {
            ScoreLogEntry entry;
            entry.timestampMs = fused.timestampMs;
            entry.touch = touchScore;
            entry.typing = typingScore;
            entry.usage = usageScore;
            entry.fused = fused.finalScore;
            entry.risk = riskLevelToString(fused.riskLevel);
            auto logged = store_->appendScoreLog(entry);
            if (!logged) {
                LOG_WARN_COMP("score log not recorded: " + logged.error().message, "AgentSuite");
            }
        }

        return SuiteVerdict{touchResult, typingResult, usageResult, fused, alert, external};
    }

}
