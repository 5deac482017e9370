#include "TouchAgent.h"
#include "LoggerMacros.h"
#include "StateCodec.h"
#include <algorithm>
#include <cmath>
#include <exception>

namespace BehaviorSentinel {

    namespace {

        constexpr double LINEAR_PATH_DEVIATION = 1.0;
        constexpr double ULTRA_FAST_VELOCITY = 5.0;     // px per ms
        constexpr double SIMILAR_DURATION_MS = 10.0;
        constexpr size_t STATE_FIELDS = 14;

    }

    TouchAgent::Settings TouchAgent::Settings::fromConfig(const Config& config) {
        Settings s;
        s.warmupGestures = config.getSize("touch.warmup_gestures", s.warmupGestures);
        s.windowSize = config.getSize("touch.window_size", s.windowSize);
        return s;
    }

    std::string TouchAgent::State::encode() const {
        return StateWriter()
            .add(avgVelocity).add(avgVelocityVar)
            .add(peakVelocity).add(peakVelocityVar)
            .add(pathDeviation).add(pathDeviationVar)
            .add(tapDuration).add(tapDurationVar)
            .add(jitter).add(jitterVar)
            .add(pressureProfile).add(pressureProfileVar)
            .add(totalGestures)
            .add(isInWarmup)
            .str();
    }

    Result<TouchAgent::State> TouchAgent::State::decode(const std::string& text) {
        auto reader = StateReader::open(text, STATE_FIELDS);
        if (!reader) return reader.error();

        State s;
        double* doubles[] = {
            &s.avgVelocity, &s.avgVelocityVar, &s.peakVelocity, &s.peakVelocityVar,
            &s.pathDeviation, &s.pathDeviationVar, &s.tapDuration, &s.tapDurationVar,
            &s.jitter, &s.jitterVar, &s.pressureProfile, &s.pressureProfileVar,
        };
        for (double* field : doubles) {
            auto value = reader->nextDouble();
            if (!value) return value.error();
            *field = *value;
        }

        auto gestures = reader->nextInt();
        if (!gestures) return gestures.error();
        s.totalGestures = *gestures;

        auto warmup = reader->nextBool();
        if (!warmup) return warmup.error();
        s.isInWarmup = *warmup;
        return s;
    }

    TouchAgent::TouchAgent() : TouchAgent(Settings{}) {}

    TouchAgent::TouchAgent(Settings settings, Clock clock)
        : settings_(settings),
          clock_(clock ? std::move(clock) : systemClock()),
          window_(settings.windowSize) {
    }

    void TouchAgent::start() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_ = true;
        }
        LOG_INFO_COMP_IF("started monitoring", AGENT_NAME);
    }

    void TouchAgent::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_ = false;
            segmenter_.clear();
            window_.clear();
            latest_.reset();
        }
        LOG_INFO_COMP_IF("stopped monitoring", AGENT_NAME);
    }

    bool TouchAgent::isActive() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

    void TouchAgent::resetBaseline() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            avgVelocity_.reset();
            peakVelocity_.reset();
            pathDeviation_.reset();
            tapDuration_.reset();
            jitter_.reset();
            pressure_.reset();
            recent_ = RecentMetrics{};
            totalGestures_ = 0;
            inWarmup_ = true;
            segmenter_.clear();
            window_.clear();
            latest_.reset();
        }
        LOG_INFO_COMP_IF("baseline reset", AGENT_NAME);
    }

    TouchSample TouchAgent::makeSample(int pointerId, float x, float y, float pressure, float size) const {
        TouchSample sample;
        sample.timestampMs = clock_();
        sample.pointerId = pointerId;
        sample.x = x;
        sample.y = y;
        sample.pressure = pressure;
        sample.size = size;
        return sample;
    }

    void TouchAgent::onTouchDown(int pointerId, float x, float y, float pressure, float size) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return;
        segmenter_.onDown(makeSample(pointerId, x, y, pressure, size));
    }

    void TouchAgent::onTouchMove(int pointerId, float x, float y, float pressure, float size) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return;
        segmenter_.onMove(makeSample(pointerId, x, y, pressure, size));
    }

    void TouchAgent::onTouchUp(int pointerId, float x, float y, float pressure, float size) {
        std::optional<GestureFeatures> completed;
        std::vector<std::pair<ListenerId, FeatureListener>> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_) return;
            completed = segmenter_.onUp(makeSample(pointerId, x, y, pressure, size));
            if (!completed) return;
            completeGesture(*completed);
            listeners = listeners_;
        }

        // Listeners run unlocked so they may query the agent.
        for (const auto& [id, listener] : listeners) {
            try {
                listener(*completed);
            } catch (const std::exception& e) {
                LOG_WARN_COMP("feature listener " + std::to_string(id) + " failed: " + e.what(), AGENT_NAME);
            }
        }
    }

    void TouchAgent::add(TouchPhase phase, int pointerId, float x, float y, float pressure, float size) {
        switch (phase) {
            case TouchPhase::DOWN:
                onTouchDown(pointerId, x, y, pressure, size);
                break;
            case TouchPhase::MOVE:
                onTouchMove(pointerId, x, y, pressure, size);
                break;
            case TouchPhase::UP:
                onTouchUp(pointerId, x, y, pressure, size);
                break;
        }
    }

    // Caller holds mutex_.
    void TouchAgent::completeGesture(const GestureFeatures& features) {
        window_.push(features);
        latest_ = features;
        ++totalGestures_;

        updateBaselines(features);
        updateRecentMetrics();

        LOG_DEBUG_COMP_IF(std::string(gestureTypeToString(features.type)) + " gesture, " +
                          std::to_string(features.durationMs()) + " ms", AGENT_NAME);

        // Checked after the baseline update: the gesture that ends warmup is not learned.
        if (inWarmup_ && totalGestures_ >= static_cast<int64_t>(settings_.warmupGestures)) {
            inWarmup_ = false;
            LOG_INFO_COMP_IF("completed warmup phase", AGENT_NAME);
        }
    }

    void TouchAgent::updateBaselines(const GestureFeatures& features) {
        if (inWarmup_) return;

        avgVelocity_.update(features.avgVelocity);
        peakVelocity_.update(features.peakVelocity);
        pathDeviation_.update(features.pathDeviation);
        jitter_.update(features.jitter);
        pressure_.update(features.avgPressure);

        if (features.type == GestureType::TAP) {
            tapDuration_.update(static_cast<double>(features.durationMs()));
        }
    }

    void TouchAgent::updateRecentMetrics() {
        if (window_.empty()) return;

        recent_.avgVelocity = window_.mean([](const GestureFeatures& g) { return g.avgVelocity; });
        recent_.peakVelocity = window_.mean([](const GestureFeatures& g) { return g.peakVelocity; });
        recent_.pathDeviation = window_.mean([](const GestureFeatures& g) { return g.pathDeviation; });
        recent_.jitter = window_.mean([](const GestureFeatures& g) { return g.jitter; });
        recent_.pressure = window_.mean([](const GestureFeatures& g) { return g.avgPressure; });

        double tapSum = 0.0;
        size_t taps = 0;
        for (const auto& g : window_) {
            if (g.type != GestureType::TAP) continue;
            tapSum += static_cast<double>(g.durationMs());
            ++taps;
        }
        recent_.tapDuration = taps > 0 ? tapSum / static_cast<double>(taps) : 0.0;
    }

    AgentResult TouchAgent::getResult() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = clock_();

        if (!active_) {
            return AgentResult(0.0, {"agent not active"}, now);
        }
        if (inWarmup_ || totalGestures_ < static_cast<int64_t>(MIN_GESTURES_FOR_SCORE)) {
            return AgentResult(0.0, {"insufficient data for analysis"}, now);
        }

        double score = calculateAnomalyScore();
        return AgentResult(score, generateExplanations(score), now);
    }

    double TouchAgent::boundedZ(double recent, const EwmaStat& baseline) {
        return std::min(1.0, baseline.zScore(recent) / 3.0);
    }

    // Components with zero baseline variance add nothing; weights are not renormalized.
    double TouchAgent::calculateAnomalyScore() const {
        double total = 0.0;

        if (avgVelocity_.variance() > 0) {
            total += W_VELOCITY * boundedZ(recent_.avgVelocity, avgVelocity_);
        }
        if (pathDeviation_.variance() > 0) {
            total += W_PATH_DEVIATION * boundedZ(recent_.pathDeviation, pathDeviation_);
        }
        if (tapDuration_.variance() > 0 && recent_.tapDuration > 0) {
            total += W_TAP_DURATION * boundedZ(recent_.tapDuration, tapDuration_);
        }
        if (jitter_.variance() > 0) {
            total += W_JITTER * boundedZ(recent_.jitter, jitter_);
        }
        if (pressure_.variance() > 0) {
            total += W_PRESSURE * boundedZ(recent_.pressure, pressure_);
        }
        total += W_BOT_PATTERN * detectBotPatterns();
        return total;
    }

    double TouchAgent::botPatternScore() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return detectBotPatterns();
    }

    double TouchAgent::detectBotPatterns() const {
        if (window_.size() < MIN_GESTURES_FOR_SCORE) return 0.0;

        double size = static_cast<double>(window_.size());
        double bot = 0.0;

        size_t linear = window_.countIf([](const GestureFeatures& g) {
            return g.type == GestureType::SWIPE && g.pathDeviation < LINEAR_PATH_DEVIATION;
        });
        if (linear > size * 0.8) {
            bot += 0.5;
        }

        size_t ultraFast = window_.countIf([](const GestureFeatures& g) {
            return g.peakVelocity > ULTRA_FAST_VELOCITY;
        });
        if (ultraFast > size * 0.6) {
            bot += 0.3;
        }

        if (window_.size() >= 3) {
            double avgDuration = window_.mean([](const GestureFeatures& g) {
                return static_cast<double>(g.durationMs());
            });
            size_t similar = window_.countIf([avgDuration](const GestureFeatures& g) {
                return std::abs(static_cast<double>(g.durationMs()) - avgDuration) < SIMILAR_DURATION_MS;
            });
            if (similar > size * 0.9) {
                bot += 0.2;
            }
        }
        return std::min(1.0, bot);
    }

    std::vector<std::string> TouchAgent::generateExplanations(double score) const {
        std::vector<std::string> out;
        auto beyond = [](double recent, const EwmaStat& stat, double sigmas) {
            return stat.variance() > 0 && std::abs(recent - stat.mean()) > sigmas * std::sqrt(stat.variance());
        };

        if (score < 0.3) {
            out.emplace_back("normal touch behavior patterns");
        } else if (score < 0.6) {
            out.emplace_back("moderate touch behavior anomalies detected");
            if (beyond(recent_.avgVelocity, avgVelocity_, 1.0)) {
                out.emplace_back("unusual gesture velocity patterns");
            }
            if (beyond(recent_.pathDeviation, pathDeviation_, 1.0)) {
                out.emplace_back("irregular swipe curvature");
            }
            if (beyond(recent_.jitter, jitter_, 1.0)) {
                out.emplace_back("elevated touch instability");
            }
        } else {
            out.emplace_back("significant touch behavior anomalies");
            if (detectBotPatterns() > 0.3) {
                out.emplace_back("robotic touch patterns detected");
            }
            if (beyond(recent_.avgVelocity, avgVelocity_, 2.0)) {
                out.emplace_back("highly irregular gesture dynamics");
            }
            if (recent_.pathDeviation < LINEAR_PATH_DEVIATION) {
                out.emplace_back("suspiciously linear touch paths");
            }
        }
        return out;
    }

    TouchAgent::State TouchAgent::getState() const {
        std::lock_guard<std::mutex> lock(mutex_);
        State s;
        s.avgVelocity = avgVelocity_.mean();
        s.avgVelocityVar = avgVelocity_.variance();
        s.peakVelocity = peakVelocity_.mean();
        s.peakVelocityVar = peakVelocity_.variance();
        s.pathDeviation = pathDeviation_.mean();
        s.pathDeviationVar = pathDeviation_.variance();
        s.tapDuration = tapDuration_.mean();
        s.tapDurationVar = tapDuration_.variance();
        s.jitter = jitter_.mean();
        s.jitterVar = jitter_.variance();
        s.pressureProfile = pressure_.mean();
        s.pressureProfileVar = pressure_.variance();
        s.totalGestures = totalGestures_;
        s.isInWarmup = inWarmup_;
        return s;
    }

    void TouchAgent::applyState(const State& state) {
        std::lock_guard<std::mutex> lock(mutex_);
        avgVelocity_.restore(state.avgVelocity, state.avgVelocityVar);
        peakVelocity_.restore(state.peakVelocity, state.peakVelocityVar);
        pathDeviation_.restore(state.pathDeviation, state.pathDeviationVar);
        tapDuration_.restore(state.tapDuration, state.tapDurationVar);
        jitter_.restore(state.jitter, state.jitterVar);
        pressure_.restore(state.pressureProfile, state.pressureProfileVar);
        totalGestures_ = state.totalGestures;
        inWarmup_ = state.isInWarmup;
    }

    std::string TouchAgent::exportState() const {
        return getState().encode();
    }

    Result<void> TouchAgent::importState(const std::string& encoded) {
        auto state = State::decode(encoded);
        if (!state) return state.error();
        applyState(*state);
        return Ok();
    }

    TouchAgent::ListenerId TouchAgent::addFeatureListener(FeatureListener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        ListenerId id = nextListenerId_++;
        listeners_.emplace_back(id, std::move(listener));
        return id;
    }

    bool TouchAgent::removeFeatureListener(ListenerId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(listeners_.begin(), listeners_.end(),
                               [id](const auto& entry) { return entry.first == id; });
        if (it == listeners_.end()) return false;
        listeners_.erase(it);
        return true;
    }

    std::optional<GestureFeatures> TouchAgent::latestFeatures() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return latest_;
    }

    size_t TouchAgent::windowCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return window_.size();
    }

    int64_t TouchAgent::totalGestures() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return totalGestures_;
    }

    bool TouchAgent::isInWarmup() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inWarmup_;
    }

}
