#pragma once

#include "IAgent.h"
#include "Clock.h"
#include "Config.h"
#include "EwmaStat.h"
#include "BoundedWindow.h"
#include "SlidingTimeWindow.h"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace BehaviorSentinel {

    enum class UsageEventType {
        APP_OPENED,
        APP_CLOSED,
        APP_SWITCH,
        SCREEN_ON,
        SCREEN_OFF,
        UNLOCK
    };

    /**
     * @brief App usage analyzer: launch rate, switch rate, session length, unseen apps
     *
     * Baselines move only when a session closes after warmup. Rate baselines
     * absorb the rates computed at the previous event, not the closing one.
     * All public methods are thread-safe.
     */
    class UsageAgent : public IAgent {
    public:
        static constexpr const char* AGENT_NAME = "UsageAgent";
        static constexpr int64_t MIN_SESSIONS_FOR_SCORE = 2;

        static constexpr double W_LAUNCH_RATE = 0.3;
        static constexpr double W_SWITCH_RATE = 0.3;
        static constexpr double W_SESSION_DURATION = 0.3;
        static constexpr double W_NEW_APP = 0.1;

        struct Settings {
            size_t warmupSessions{20};
            int64_t rateWindowMs{120000};
            size_t durationWindowSize{100};
            bool hashAppIds{false};

            static Settings fromConfig(const Config& config);
        };

        struct State {
            double launchRatePerMin{0.0};
            double switchRatePerMin{0.0};
            double avgSessionMs{0.0};
            double sessionVariance{0.0};
            int64_t totalSessions{0};
            bool inWarmup{true};

            std::string encode() const;
            static Result<State> decode(const std::string& text);
        };

        struct Metrics {
            double launchRatePerMin{0.0};
            double switchRatePerMin{0.0};
            double avgSessionMs{0.0};
            double sessionVariance{0.0};
            bool newAppUsed{false};
            size_t knownApps{0};
            int64_t totalSessions{0};
            bool inWarmup{true};
        };

        UsageAgent();
        explicit UsageAgent(Settings settings, Clock clock = systemClock());

        void start() override;
        void stop() override;
        AgentResult getResult() const override;
        void resetBaseline() override;
        bool isActive() const override;
        std::string getName() const override { return AGENT_NAME; }
        std::string exportState() const override;
        Result<void> importState(const std::string& encoded) override;

        void onAppOpened(const std::string& appId);
        void onAppClosed(const std::string& appId);
        void onAppSwitch(const std::string& fromApp, const std::string& toApp);
        void onScreenOn() {}
        void onScreenOff();
        void onUnlock() {}

        /// Tagged dispatch; b is used only by APP_SWITCH
        void add(UsageEventType type, const std::string& a = "", const std::string& b = "");

        State getState() const;
        void applyState(const State& state);
        Metrics getMetrics() const;

        /**
         * @brief Identifier as tracked: raw, or 16 hex chars of SHA-256 when hashing is on
         */
        std::string normalizeAppId(const std::string& appId) const;

    private:
        struct Session {
            std::string app;
            int64_t startMs;
            std::optional<int64_t> endMs;

            int64_t durationMs(int64_t nowMs) const {
                int64_t end = endMs ? *endMs : nowMs;
                return end > startMs ? end - startMs : 0;
            }
        };

        void openSession(const std::string& app, int64_t nowMs);
        void closeCurrentSession(int64_t nowMs);
        void updateBaselines(int64_t sessionMs);
        void recomputeRecents(int64_t nowMs);
        void markAppSeen(const std::string& app);
        double calculateAnomalyScore() const;
        std::vector<std::string> generateExplanations(double score) const;

        static double poissonZ(double recent, double baseline);

        mutable std::mutex mutex_;
        Settings settings_;
        Clock clock_;

        bool active_{false};
        bool inWarmup_{true};
        int64_t totalSessions_{0};

        SlidingTimeWindow launches_;
        SlidingTimeWindow switches_;
        BoundedWindow<int64_t> sessionDurations_;
        std::unordered_set<std::string> knownApps_;
        std::optional<Session> currentSession_;

        EwmaStat launchRate_;
        EwmaStat switchRate_;
        EwmaStat sessionLength_;

        double recentLaunchRate_{0.0};
        double recentSwitchRate_{0.0};
        double recentAvgSessionMs_{0.0};
        double recentSessionVariance_{0.0};
        bool recentNewAppUsed_{false};
    };

}
