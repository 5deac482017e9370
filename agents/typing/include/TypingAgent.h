#pragma once

#include "IAgent.h"
#include "Clock.h"
#include "Config.h"
#include "EwmaStat.h"
#include "BoundedWindow.h"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace BehaviorSentinel {

    /**
     * @brief Keystroke dynamics analyzer
     *
     * Learns dwell (hold) and flight (down-to-down) times from key timing only;
     * key codes are kept solely to pair DOWN/UP and to spot corrections.
     * All public methods are thread-safe.
     */
    class TypingAgent : public IAgent {
    public:
        static constexpr const char* AGENT_NAME = "TypingAgent";
        static constexpr int64_t MIN_KEYSTROKES_FOR_SCORE = 5;
        static constexpr int KEYCODE_BACKSPACE = 8;
        static constexpr int KEYCODE_DELETE = 67;
        static constexpr int64_t PASTE_GAP_MS = 10;

        static constexpr double W_DWELL = 0.3;
        static constexpr double W_FLIGHT = 0.3;
        static constexpr double W_BACKSPACE = 0.2;
        static constexpr double W_PASTE = 0.2;

        struct Settings {
            size_t warmupKeystrokes{100};
            size_t windowSize{50};
            size_t eventWindowSize{100};

            static Settings fromConfig(const Config& config);
        };

        struct State {
            double dwellMean{0.0};
            double dwellVariance{0.0};
            double flightMean{0.0};
            double flightVariance{0.0};
            double backspaceRate{0.0};
            int64_t totalKeystrokes{0};
            bool isInWarmup{true};

            std::string encode() const;
            static Result<State> decode(const std::string& text);
        };

        /// Window statistics as last recomputed
        struct Metrics {
            double dwellMean{0.0};
            double dwellVariance{0.0};
            double flightMean{0.0};
            double flightVariance{0.0};
            double backspaceRate{0.0};
            bool pasteDetected{false};
            int64_t totalKeystrokes{0};
            bool inWarmup{true};
        };

        TypingAgent();
        explicit TypingAgent(Settings settings, Clock clock = systemClock());

        void start() override;
        void stop() override;
        AgentResult getResult() const override;
        void resetBaseline() override;
        bool isActive() const override;
        std::string getName() const override { return AGENT_NAME; }
        std::string exportState() const override;
        Result<void> importState(const std::string& encoded) override;

        /**
         * @brief Record a key transition; only key-down events count as keystrokes
         */
        void onKeyEvent(bool isKeyDown, int keyCode, float pressure);

        State getState() const;
        void applyState(const State& state);
        Metrics getMetrics() const;

    private:
        struct KeyEvent {
            int64_t timestampMs;
            bool isKeyDown;
            int keyCode;
            float pressure;
        };

        void processKeystroke(const KeyEvent& event);
        void addDwellTime(double dwellMs);
        void addFlightTime(double flightMs);
        void updateRecentMetrics();
        double calculateAnomalyScore() const;
        std::vector<std::string> generateExplanations(double score) const;

        mutable std::mutex mutex_;
        Settings settings_;
        Clock clock_;

        bool active_{false};
        bool inWarmup_{true};
        int64_t totalKeystrokes_{0};

        BoundedWindow<KeyEvent> events_;
        BoundedWindow<double> dwellTimes_;
        BoundedWindow<double> flightTimes_;

        std::optional<int64_t> lastKeyDownMs_;
        int lastKeyCode_{-1};

        EwmaStat dwell_;
        EwmaStat flight_;
        double baselineBackspaceRate_{0.0};

        double recentDwellMean_{0.0};
        double recentDwellVariance_{0.0};
        double recentFlightMean_{0.0};
        double recentFlightVariance_{0.0};
        double recentBackspaceRate_{0.0};
        bool recentPasteDetected_{false};
    };

}
