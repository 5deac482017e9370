#include "TypingAgent.h"
#include "LoggerMacros.h"
#include "StateCodec.h"
#include <algorithm>
#include <cmath>

namespace BehaviorSentinel {

    namespace {

        constexpr size_t STATE_FIELDS = 7;
        constexpr double BACKSPACE_RATE_CAP = 0.3;
        constexpr double HIGH_ERROR_RATE = 0.2;

    }

    TypingAgent::Settings TypingAgent::Settings::fromConfig(const Config& config) {
        Settings s;
        s.warmupKeystrokes = config.getSize("typing.warmup_keystrokes", s.warmupKeystrokes);
        s.windowSize = config.getSize("typing.window_size", s.windowSize);
        s.eventWindowSize = config.getSize("typing.event_window_size", s.eventWindowSize);
        return s;
    }

    std::string TypingAgent::State::encode() const {
        return StateWriter()
            .add(dwellMean).add(dwellVariance)
            .add(flightMean).add(flightVariance)
            .add(backspaceRate)
            .add(totalKeystrokes)
            .add(isInWarmup)
            .str();
    }

    Result<TypingAgent::State> TypingAgent::State::decode(const std::string& text) {
        auto reader = StateReader::open(text, STATE_FIELDS);
        if (!reader) return reader.error();

        State s;
        for (double* field : {&s.dwellMean, &s.dwellVariance, &s.flightMean, &s.flightVariance, &s.backspaceRate}) {
            auto value = reader->nextDouble();
            if (!value) return value.error();
            *field = *value;
        }
        auto keystrokes = reader->nextInt();
        if (!keystrokes) return keystrokes.error();
        s.totalKeystrokes = *keystrokes;

        auto warmup = reader->nextBool();
        if (!warmup) return warmup.error();
        s.isInWarmup = *warmup;
        return s;
    }

    TypingAgent::TypingAgent() : TypingAgent(Settings{}) {}

    TypingAgent::TypingAgent(Settings settings, Clock clock)
        : settings_(settings),
          clock_(clock ? std::move(clock) : systemClock()),
          events_(settings.eventWindowSize),
          dwellTimes_(settings.windowSize),
          flightTimes_(settings.windowSize) {
    }

    void TypingAgent::start() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_ = true;
        }
        LOG_INFO_COMP_IF("started monitoring", AGENT_NAME);
    }

    void TypingAgent::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_ = false;
            events_.clear();
            dwellTimes_.clear();
            flightTimes_.clear();
            lastKeyDownMs_.reset();
            lastKeyCode_ = -1;
        }
        LOG_INFO_COMP_IF("stopped monitoring", AGENT_NAME);
    }

    bool TypingAgent::isActive() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

    void TypingAgent::resetBaseline() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dwell_.reset();
            flight_.reset();
            baselineBackspaceRate_ = 0.0;
            totalKeystrokes_ = 0;
            inWarmup_ = true;
            events_.clear();
            dwellTimes_.clear();
            flightTimes_.clear();
            lastKeyDownMs_.reset();
            lastKeyCode_ = -1;
            recentDwellMean_ = 0.0;
            recentDwellVariance_ = 0.0;
            recentFlightMean_ = 0.0;
            recentFlightVariance_ = 0.0;
            recentBackspaceRate_ = 0.0;
            recentPasteDetected_ = false;
        }
        LOG_INFO_COMP_IF("baseline reset", AGENT_NAME);
    }

    void TypingAgent::onKeyEvent(bool isKeyDown, int keyCode, float pressure) {
        bool warmupCompleted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_) return;

            KeyEvent event{clock_(), isKeyDown, keyCode, pressure};
            events_.push(event);
            processKeystroke(event);

            if (isKeyDown) {
                ++totalKeystrokes_;
            }
            if (inWarmup_ && totalKeystrokes_ >= static_cast<int64_t>(settings_.warmupKeystrokes)) {
                inWarmup_ = false;
                warmupCompleted = true;
            }
        }
        if (warmupCompleted) {
            LOG_INFO_COMP_IF("completed warmup phase", AGENT_NAME);
        }
    }

    // Caller holds mutex_.
    void TypingAgent::processKeystroke(const KeyEvent& event) {
        recentPasteDetected_ = false;

        if (event.isKeyDown) {
            if (lastKeyDownMs_) {
                int64_t gap = event.timestampMs - *lastKeyDownMs_;
                addFlightTime(static_cast<double>(gap));
                recentPasteDetected_ = gap < PASTE_GAP_MS;
            }
            lastKeyDownMs_ = event.timestampMs;
            lastKeyCode_ = event.keyCode;
        } else if (lastKeyDownMs_ && event.keyCode == lastKeyCode_) {
            addDwellTime(static_cast<double>(event.timestampMs - *lastKeyDownMs_));
        }

        updateRecentMetrics();
    }

    void TypingAgent::addDwellTime(double dwellMs) {
        dwellTimes_.push(dwellMs);
        if (!inWarmup_) {
            dwell_.update(dwellMs);
        }
    }

    void TypingAgent::addFlightTime(double flightMs) {
        flightTimes_.push(flightMs);
        if (!inWarmup_) {
            flight_.update(flightMs);
        }
    }

    void TypingAgent::updateRecentMetrics() {
        if (!dwellTimes_.empty()) {
            recentDwellMean_ = dwellTimes_.mean();
            recentDwellVariance_ = dwellTimes_.variance();
        }
        if (!flightTimes_.empty()) {
            recentFlightMean_ = flightTimes_.mean();
            recentFlightVariance_ = flightTimes_.variance();
        }

        size_t corrections = events_.countIf([](const KeyEvent& e) {
            return e.isKeyDown && (e.keyCode == KEYCODE_BACKSPACE || e.keyCode == KEYCODE_DELETE);
        });
        recentBackspaceRate_ = events_.empty()
            ? 0.0
            : static_cast<double>(corrections) / static_cast<double>(events_.size());
    }

    AgentResult TypingAgent::getResult() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = clock_();

        if (!active_) {
            return AgentResult(0.0, {"agent not active"}, now);
        }
        if (inWarmup_ || totalKeystrokes_ < MIN_KEYSTROKES_FOR_SCORE) {
            return AgentResult(0.0, {"insufficient data for analysis"}, now);
        }

        double score = calculateAnomalyScore();
        return AgentResult(score, generateExplanations(score), now);
    }

    // Gated-off components contribute 0; the sum is not renormalized.
    double TypingAgent::calculateAnomalyScore() const {
        double total = 0.0;

        if (dwell_.variance() > 0 && !dwellTimes_.empty()) {
            total += W_DWELL * std::min(1.0, dwell_.zScore(recentDwellMean_) / 3.0);
        }
        if (flight_.variance() > 0 && !flightTimes_.empty()) {
            total += W_FLIGHT * std::min(1.0, flight_.zScore(recentFlightMean_) / 3.0);
        }
        if (recentBackspaceRate_ > baselineBackspaceRate_ * 2) {
            total += W_BACKSPACE * std::min(1.0, recentBackspaceRate_ / BACKSPACE_RATE_CAP);
        }
        if (recentPasteDetected_) {
            total += W_PASTE;
        }
        return total;
    }

    std::vector<std::string> TypingAgent::generateExplanations(double score) const {
        std::vector<std::string> out;
        double dwellSd = std::sqrt(dwell_.variance());
        double flightSd = std::sqrt(flight_.variance());
        double dwellShift = std::abs(recentDwellMean_ - dwell_.mean());

        if (score < 0.3) {
            out.emplace_back("normal typing rhythm");
        } else if (score < 0.6) {
            out.emplace_back("moderate typing anomalies detected");
            if (dwell_.variance() > 0 && dwellShift > dwellSd) {
                out.emplace_back("irregular key hold times");
            }
            if (flight_.variance() > 0 && std::abs(recentFlightMean_ - flight_.mean()) > flightSd) {
                out.emplace_back("unusual inter-key timing");
            }
            if (recentBackspaceRate_ > baselineBackspaceRate_ * 1.5) {
                out.emplace_back("elevated correction rate");
            }
        } else {
            out.emplace_back("significant typing behavior anomalies");
            if (recentPasteDetected_) {
                out.emplace_back("rapid input detected");
            }
            if (recentBackspaceRate_ > HIGH_ERROR_RATE) {
                out.emplace_back("high error rate");
            }
            if (dwell_.variance() > 0 && dwellShift > 2 * dwellSd) {
                out.emplace_back("highly irregular key timing");
            }
        }
        return out;
    }

    TypingAgent::State TypingAgent::getState() const {
        std::lock_guard<std::mutex> lock(mutex_);
        State s;
        s.dwellMean = dwell_.mean();
        s.dwellVariance = dwell_.variance();
        s.flightMean = flight_.mean();
        s.flightVariance = flight_.variance();
        s.backspaceRate = baselineBackspaceRate_;
        s.totalKeystrokes = totalKeystrokes_;
        s.isInWarmup = inWarmup_;
        return s;
    }

    void TypingAgent::applyState(const State& state) {
        std::lock_guard<std::mutex> lock(mutex_);
        dwell_.restore(state.dwellMean, state.dwellVariance);
        flight_.restore(state.flightMean, state.flightVariance);
        baselineBackspaceRate_ = state.backspaceRate;
        totalKeystrokes_ = state.totalKeystrokes;
        inWarmup_ = state.isInWarmup;
    }

    std::string TypingAgent::exportState() const {
        return getState().encode();
    }

    Result<void> TypingAgent::importState(const std::string& encoded) {
        auto state = State::decode(encoded);
        if (!state) return state.error();
        applyState(*state);
        return Ok();
    }

    TypingAgent::Metrics TypingAgent::getMetrics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Metrics m;
        m.dwellMean = recentDwellMean_;
        m.dwellVariance = recentDwellVariance_;
        m.flightMean = recentFlightMean_;
        m.flightVariance = recentFlightVariance_;
        m.backspaceRate = recentBackspaceRate_;
        m.pasteDetected = recentPasteDetected_;
        m.totalKeystrokes = totalKeystrokes_;
        m.inWarmup = inWarmup_;
        return m;
    }

}
