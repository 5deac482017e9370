#pragma once

#include "IExternalScorer.h"
#include <cstdint>
#include <string>

namespace BehaviorSentinel {

    enum class TouchPhase {
        DOWN,
        MOVE,
        UP
    };

    /**
     * @brief One pointer sample. Lives only until its gesture is reduced to features.
     */
    struct TouchSample {
        int64_t timestampMs{0};
        int pointerId{0};
        float x{0.0f};
        float y{0.0f};
        float pressure{0.0f};
        float size{0.0f};
    };

    enum class GestureType {
        TAP,
        SWIPE,
        MULTI_TOUCH     // reserved
    };

    const char* gestureTypeToString(GestureType type);

    /**
     * @brief Feature vector of one completed gesture; contains no coordinates
     */
    struct GestureFeatures {
        int64_t startMs{0};
        int64_t endMs{0};
        int pointerId{0};
        GestureType type{GestureType::TAP};

        double totalDistance{0.0};
        double avgVelocity{0.0};        // px per ms
        double peakVelocity{0.0};
        double avgPressure{0.0};
        double peakPressure{0.0};
        double pathDeviation{0.0};      // mean perpendicular distance to the start-end chord
        int directionChanges{0};
        double jitter{0.0};             // stddev of the perpendicular distances

        int64_t durationMs() const { return endMs - startMs; }

        static std::string csvHeader();
        std::string toCsvRow() const;

        /**
         * @brief Named features for an external scorer (no timestamp, no type)
         */
        FeatureMap toFeatureMap() const;
    };

}
