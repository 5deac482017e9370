#include "UsageAgent.h"
#include "LoggerMacros.h"
#include "SHA256.h"
#include "StateCodec.h"
#include <algorithm>
#include <cmath>

namespace BehaviorSentinel {

    namespace {

        constexpr size_t STATE_FIELDS = 6;
        constexpr size_t APP_ID_DIGEST_BYTES = 8;

    }

    UsageAgent::Settings UsageAgent::Settings::fromConfig(const Config& config) {
        Settings s;
        s.warmupSessions = config.getSize("usage.warmup_sessions", s.warmupSessions);
        s.rateWindowMs = static_cast<int64_t>(config.getSize("usage.rate_window_ms", static_cast<size_t>(s.rateWindowMs)));
        s.durationWindowSize = config.getSize("usage.duration_window_size", s.durationWindowSize);
        s.hashAppIds = config.getBool("usage.hash_app_ids", s.hashAppIds);
        return s;
    }

    std::string UsageAgent::State::encode() const {
        return StateWriter()
            .add(launchRatePerMin)
            .add(switchRatePerMin)
            .add(avgSessionMs)
            .add(sessionVariance)
            .add(totalSessions)
            .add(inWarmup)
            .str();
    }

    Result<UsageAgent::State> UsageAgent::State::decode(const std::string& text) {
        auto reader = StateReader::open(text, STATE_FIELDS);
        if (!reader) return reader.error();

        State s;
        for (double* field : {&s.launchRatePerMin, &s.switchRatePerMin, &s.avgSessionMs, &s.sessionVariance}) {
            auto value = reader->nextDouble();
            if (!value) return value.error();
            *field = *value;
        }
        auto sessions = reader->nextInt();
        if (!sessions) return sessions.error();
        s.totalSessions = *sessions;

        auto warmup = reader->nextBool();
        if (!warmup) return warmup.error();
        s.inWarmup = *warmup;
        return s;
    }

    UsageAgent::UsageAgent() : UsageAgent(Settings{}) {}

    UsageAgent::UsageAgent(Settings settings, Clock clock)
        : settings_(settings),
          clock_(clock ? std::move(clock) : systemClock()),
          launches_(settings.rateWindowMs),
          switches_(settings.rateWindowMs),
          sessionDurations_(settings.durationWindowSize) {
    }

    void UsageAgent::start() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_ = true;
        }
        LOG_INFO_COMP_IF("started monitoring", AGENT_NAME);
    }

    void UsageAgent::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_ = false;
            launches_.clear();
            switches_.clear();
            sessionDurations_.clear();
            currentSession_.reset();
        }
        LOG_INFO_COMP_IF("stopped monitoring", AGENT_NAME);
    }

    bool UsageAgent::isActive() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

    void UsageAgent::resetBaseline() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            launchRate_.reset();
            switchRate_.reset();
            sessionLength_.reset();
            totalSessions_ = 0;
            inWarmup_ = true;
            launches_.clear();
            switches_.clear();
            sessionDurations_.clear();
            knownApps_.clear();
            currentSession_.reset();
            recentLaunchRate_ = 0.0;
            recentSwitchRate_ = 0.0;
            recentAvgSessionMs_ = 0.0;
            recentSessionVariance_ = 0.0;
            recentNewAppUsed_ = false;
        }
        LOG_INFO_COMP_IF("baseline reset", AGENT_NAME);
    }

    std::string UsageAgent::normalizeAppId(const std::string& appId) const {
        if (!settings_.hashAppIds) {
            return appId;
        }
        auto digest = SHA256::hexDigest(appId, APP_ID_DIGEST_BYTES);
        if (!digest) {
            LOG_WARN_COMP("SHA-256 unavailable, tracking raw app id", AGENT_NAME);
            return appId;
        }
        return *digest;
    }

    void UsageAgent::onAppOpened(const std::string& appId) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return;

        std::string id = normalizeAppId(appId);
        int64_t now = clock_();
        launches_.push(now);
        launches_.prune(now);
        openSession(id, now);
        markAppSeen(id);
        recomputeRecents(now);
    }

    void UsageAgent::onAppClosed(const std::string& appId) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return;

        std::string id = normalizeAppId(appId);
        int64_t now = clock_();
        if (currentSession_ && currentSession_->app == id) {
            closeCurrentSession(now);
        }
        recomputeRecents(now);
    }

    void UsageAgent::onAppSwitch(const std::string& fromApp, const std::string& toApp) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return;

        int64_t now = clock_();
        switches_.push(now);
        switches_.prune(now);

        std::string fromId = normalizeAppId(fromApp);
        if (currentSession_ && currentSession_->app == fromId) {
            closeCurrentSession(now);
        }

        std::string toId = normalizeAppId(toApp);
        openSession(toId, now);
        markAppSeen(toId);
        recomputeRecents(now);
    }

    void UsageAgent::onScreenOff() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || !currentSession_) return;

        int64_t now = clock_();
        closeCurrentSession(now);
        recomputeRecents(now);
    }

    void UsageAgent::add(UsageEventType type, const std::string& a, const std::string& b) {
        switch (type) {
            case UsageEventType::APP_OPENED:
                onAppOpened(a);
                break;
            case UsageEventType::APP_CLOSED:
                onAppClosed(a);
                break;
            case UsageEventType::APP_SWITCH:
                onAppSwitch(a, b);
                break;
            case UsageEventType::SCREEN_ON:
                onScreenOn();
                break;
            case UsageEventType::SCREEN_OFF:
                onScreenOff();
                break;
            case UsageEventType::UNLOCK:
                onUnlock();
                break;
        }
    }

    // Caller holds mutex_ for every helper below.
    void UsageAgent::openSession(const std::string& app, int64_t nowMs) {
        currentSession_ = Session{app, nowMs, std::nullopt};
    }

    void UsageAgent::closeCurrentSession(int64_t nowMs) {
        currentSession_->endMs = nowMs;
        int64_t duration = currentSession_->durationMs(nowMs);
        sessionDurations_.push(duration);
        ++totalSessions_;

        // Warmup ends before the baseline update: the closing session is learned.
        if (inWarmup_ && totalSessions_ >= static_cast<int64_t>(settings_.warmupSessions)) {
            inWarmup_ = false;
            LOG_INFO_COMP_IF("completed warmup phase", AGENT_NAME);
        }
        if (!inWarmup_) {
            updateBaselines(duration);
        }
        currentSession_.reset();
    }

    void UsageAgent::updateBaselines(int64_t sessionMs) {
        launchRate_.update(recentLaunchRate_);
        switchRate_.update(recentSwitchRate_);
        sessionLength_.update(static_cast<double>(sessionMs));
    }

    void UsageAgent::recomputeRecents(int64_t nowMs) {
        launches_.prune(nowMs);
        switches_.prune(nowMs);
        recentLaunchRate_ = launches_.ratePerMinute();
        recentSwitchRate_ = switches_.ratePerMinute();

        if (!sessionDurations_.empty()) {
            auto asDouble = [](int64_t d) { return static_cast<double>(d); };
            recentAvgSessionMs_ = sessionDurations_.mean(asDouble);
            recentSessionVariance_ = sessionDurations_.variance(asDouble);
        }
    }

    void UsageAgent::markAppSeen(const std::string& app) {
        if (knownApps_.insert(app).second) {
            // Unseen apps are expected while the baseline is still forming.
            recentNewAppUsed_ = !inWarmup_;
        } else {
            recentNewAppUsed_ = false;
        }
    }

    AgentResult UsageAgent::getResult() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = clock_();

        if (!active_) {
            return AgentResult(0.0, {"agent not active"}, now);
        }
        if (inWarmup_ || totalSessions_ < MIN_SESSIONS_FOR_SCORE) {
            return AgentResult(0.0, {"insufficient data for analysis"}, now);
        }

        double score = calculateAnomalyScore();
        return AgentResult(score, generateExplanations(score), now);
    }

    double UsageAgent::poissonZ(double recent, double baseline) {
        return std::abs(recent - baseline) / std::max(EwmaStat::STDDEV_EPSILON, std::sqrt(baseline));
    }

    // Unlike the touch and typing scores, this one is divided by the weight that applied.
    double UsageAgent::calculateAnomalyScore() const {
        double total = 0.0;
        double weightSum = 0.0;

        if (launchRate_.mean() > 0) {
            total += W_LAUNCH_RATE * std::min(1.0, poissonZ(recentLaunchRate_, launchRate_.mean()) / 3.0);
            weightSum += W_LAUNCH_RATE;
        }
        if (switchRate_.mean() > 0) {
            total += W_SWITCH_RATE * std::min(1.0, poissonZ(recentSwitchRate_, switchRate_.mean()) / 3.0);
            weightSum += W_SWITCH_RATE;
        }
        if (sessionLength_.variance() > 0) {
            total += W_SESSION_DURATION * std::min(1.0, sessionLength_.zScore(recentAvgSessionMs_) / 3.0);
            weightSum += W_SESSION_DURATION;
        }
        total += W_NEW_APP * (recentNewAppUsed_ ? 1.0 : 0.0);
        weightSum += W_NEW_APP;

        return weightSum > 0 ? std::min(1.0, total / weightSum) : 0.0;
    }

    std::vector<std::string> UsageAgent::generateExplanations(double score) const {
        std::vector<std::string> out;
        double launchBase = launchRate_.mean();
        double switchBase = switchRate_.mean();

        if (score < 0.3) {
            out.emplace_back("normal usage behavior");
        } else if (score < 0.6) {
            out.emplace_back("moderate usage anomalies detected");
            if (launchBase > 0 && std::abs(recentLaunchRate_ - launchBase) >
                    std::sqrt(std::max(EwmaStat::STDDEV_EPSILON, launchBase))) {
                out.emplace_back("unusual app launch rate");
            }
            if (switchBase > 0 && std::abs(recentSwitchRate_ - switchBase) >
                    std::sqrt(std::max(EwmaStat::STDDEV_EPSILON, switchBase))) {
                out.emplace_back("frequent app switching");
            }
            if (sessionLength_.variance() > 0 &&
                    std::abs(recentAvgSessionMs_ - sessionLength_.mean()) > std::sqrt(sessionLength_.variance())) {
                out.emplace_back("atypical session durations");
            }
            if (recentNewAppUsed_) {
                out.emplace_back("previously unseen app used");
            }
        } else {
            out.emplace_back("significant usage behavior anomalies");
            if (recentSwitchRate_ > switchBase * 2) {
                out.emplace_back("rapid task switching bursts");
            }
            if (recentAvgSessionMs_ < sessionLength_.mean() * 0.3) {
                out.emplace_back("very short sessions");
            }
            if (recentNewAppUsed_) {
                out.emplace_back("new/unrecognized app detected");
            }
        }
        return out;
    }

    UsageAgent::State UsageAgent::getState() const {
        std::lock_guard<std::mutex> lock(mutex_);
        State s;
        s.launchRatePerMin = launchRate_.mean();
        s.switchRatePerMin = switchRate_.mean();
        s.avgSessionMs = sessionLength_.mean();
        s.sessionVariance = sessionLength_.variance();
        s.totalSessions = totalSessions_;
        s.inWarmup = inWarmup_;
        return s;
    }

    void UsageAgent::applyState(const State& state) {
        std::lock_guard<std::mutex> lock(mutex_);
        launchRate_.restore(state.launchRatePerMin, 0.0);
        switchRate_.restore(state.switchRatePerMin, 0.0);
        sessionLength_.restore(state.avgSessionMs, state.sessionVariance);
        totalSessions_ = state.totalSessions;
        inWarmup_ = state.inWarmup;
    }

    std::string UsageAgent::exportState() const {
        return getState().encode();
    }

    Result<void> UsageAgent::importState(const std::string& encoded) {
        auto state = State::decode(encoded);
        if (!state) return state.error();
        applyState(*state);
        return Ok();
    }

    UsageAgent::Metrics UsageAgent::getMetrics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Metrics m;
        m.launchRatePerMin = recentLaunchRate_;
        m.switchRatePerMin = recentSwitchRate_;
        m.avgSessionMs = recentAvgSessionMs_;
        m.sessionVariance = recentSessionVariance_;
        m.newAppUsed = recentNewAppUsed_;
        m.knownApps = knownApps_.size();
        m.totalSessions = totalSessions_;
        m.inWarmup = inWarmup_;
        return m;
    }

}
