#pragma once

#include "IAgent.h"
#include "Clock.h"
#include "Config.h"
#include "EwmaStat.h"
#include "BoundedWindow.h"
#include "GestureSegmenter.h"
#include "TouchTypes.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace BehaviorSentinel {

    /**
     * @brief Touch dynamics analyzer
     *
     * Segments pointer events into gestures, keeps the last windowSize feature
     * vectors and an EWMA baseline per feature, and scores the window against
     * the baseline. Baselines are learned only after warmupGestures gestures.
     * All public methods are thread-safe.
     */
    class TouchAgent : public IAgent {
    public:
        static constexpr const char* AGENT_NAME = "TouchAgent";
        static constexpr size_t MIN_GESTURES_FOR_SCORE = 5;

        // Score weights
        static constexpr double W_VELOCITY = 0.25;
        static constexpr double W_PATH_DEVIATION = 0.20;
        static constexpr double W_TAP_DURATION = 0.15;
        static constexpr double W_JITTER = 0.15;
        static constexpr double W_PRESSURE = 0.15;
        static constexpr double W_BOT_PATTERN = 0.10;

        struct Settings {
            size_t warmupGestures{5};
            size_t windowSize{50};

            static Settings fromConfig(const Config& config);
        };

        /**
         * @brief Persisted baseline: six EWMA mean/variance pairs plus counters
         */
        struct State {
            double avgVelocity{0.0};
            double avgVelocityVar{0.0};
            double peakVelocity{0.0};
            double peakVelocityVar{0.0};
            double pathDeviation{0.0};
            double pathDeviationVar{0.0};
            double tapDuration{0.0};
            double tapDurationVar{0.0};
            double jitter{0.0};
            double jitterVar{0.0};
            double pressureProfile{0.0};
            double pressureProfileVar{0.0};
            int64_t totalGestures{0};
            bool isInWarmup{true};

            std::string encode() const;
            static Result<State> decode(const std::string& text);
        };

        using FeatureListener = std::function<void(const GestureFeatures&)>;
        using ListenerId = uint64_t;

        TouchAgent();
        explicit TouchAgent(Settings settings, Clock clock = systemClock());

        // IAgent
        void start() override;
        void stop() override;
        AgentResult getResult() const override;
        void resetBaseline() override;
        bool isActive() const override;
        std::string getName() const override { return AGENT_NAME; }
        std::string exportState() const override;
        Result<void> importState(const std::string& encoded) override;

        void onTouchDown(int pointerId, float x, float y, float pressure, float size);
        void onTouchMove(int pointerId, float x, float y, float pressure, float size);
        void onTouchUp(int pointerId, float x, float y, float pressure, float size);

        /// Tagged dispatch onto onTouchDown / onTouchMove / onTouchUp
        void add(TouchPhase phase, int pointerId, float x, float y, float pressure, float size);

        State getState() const;
        void applyState(const State& state);

        ListenerId addFeatureListener(FeatureListener listener);
        bool removeFeatureListener(ListenerId id);

        /**
         * @brief Bot-likeness of the current window in [0,1]; 0 with fewer than 5 gestures
         */
        double botPatternScore() const;

        std::optional<GestureFeatures> latestFeatures() const;
        size_t windowCount() const;
        int64_t totalGestures() const;
        bool isInWarmup() const;

    private:
        struct RecentMetrics {
            double avgVelocity{0.0};
            double peakVelocity{0.0};
            double pathDeviation{0.0};
            double tapDuration{0.0};
            double jitter{0.0};
            double pressure{0.0};
        };

        void completeGesture(const GestureFeatures& features);
        void updateBaselines(const GestureFeatures& features);
        void updateRecentMetrics();
        double calculateAnomalyScore() const;
        double detectBotPatterns() const;
        std::vector<std::string> generateExplanations(double score) const;

        static double boundedZ(double recent, const EwmaStat& baseline);
        TouchSample makeSample(int pointerId, float x, float y, float pressure, float size) const;

        mutable std::mutex mutex_;
        Settings settings_;
        Clock clock_;

        bool active_{false};
        bool inWarmup_{true};
        int64_t totalGestures_{0};

        GestureSegmenter segmenter_;
        BoundedWindow<GestureFeatures> window_;
        std::optional<GestureFeatures> latest_;
        RecentMetrics recent_;

        EwmaStat avgVelocity_;
        EwmaStat peakVelocity_;
        EwmaStat pathDeviation_;
        EwmaStat tapDuration_;
        EwmaStat jitter_;
        EwmaStat pressure_;

        std::vector<std::pair<ListenerId, FeatureListener>> listeners_;
        ListenerId nextListenerId_{1};
    };

}
