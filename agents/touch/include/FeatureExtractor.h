#pragma once

#include "TouchTypes.h"
#include <vector>

namespace BehaviorSentinel {

    /**
     * @brief Reduces a sample path to a GestureFeatures vector
     *
     * Stateless. A path is TAP when the start-to-end displacement is at most
     * TAP_MOVEMENT_THRESHOLD and the duration at most TAP_DURATION_THRESHOLD_MS.
     */
    class FeatureExtractor {
    public:
        static constexpr double TAP_MOVEMENT_THRESHOLD = 30.0;
        static constexpr int64_t TAP_DURATION_THRESHOLD_MS = 500;
        static constexpr double DIRECTION_CHANGE_RADIANS = 0.78539816339744830962;  // 45 degrees

        static GestureType classify(const std::vector<TouchSample>& path);

        /**
         * @brief Features of a path with at least two samples
         * @return Zeroed features for shorter paths
         */
        static GestureFeatures extract(const std::vector<TouchSample>& path);

        static double totalDistance(const std::vector<TouchSample>& path);
        static double peakVelocity(const std::vector<TouchSample>& path);
        static double pathDeviation(const std::vector<TouchSample>& path);
        static int directionChanges(const std::vector<TouchSample>& path);
        static double jitter(const std::vector<TouchSample>& path);

    private:
        static double distanceToChord(const TouchSample& start, const TouchSample& end, const TouchSample& point);
        static std::vector<double> interiorDeviations(const std::vector<TouchSample>& path);
    };

}
