#include "TouchTypes.h"
#include <sstream>

namespace BehaviorSentinel {

    const char* gestureTypeToString(GestureType type) {
        switch (type) {
            case GestureType::TAP: return "TAP";
            case GestureType::SWIPE: return "SWIPE";
            case GestureType::MULTI_TOUCH: return "MULTI_TOUCH";
        }
        return "UNKNOWN";
    }

    std::string GestureFeatures::csvHeader() {
        return "timestamp,gesture_type,duration_ms,total_distance,avg_velocity,peak_velocity,"
               "avg_pressure,peak_pressure,path_deviation,direction_changes,jitter";
    }

    std::string GestureFeatures::toCsvRow() const {
        std::ostringstream row;
        row << endMs << ','
            << gestureTypeToString(type) << ','
            << durationMs() << ','
            << totalDistance << ','
            << avgVelocity << ','
            << peakVelocity << ','
            << avgPressure << ','
            << peakPressure << ','
            << pathDeviation << ','
            << directionChanges << ','
            << jitter;
        return row.str();
    }

    FeatureMap GestureFeatures::toFeatureMap() const {
        return {
            {"duration_ms", static_cast<double>(durationMs())},
            {"total_distance", totalDistance},
            {"avg_velocity", avgVelocity},
            {"peak_velocity", peakVelocity},
            {"avg_pressure", avgPressure},
            {"peak_pressure", peakPressure},
            {"path_deviation", pathDeviation},
            {"direction_changes", static_cast<double>(directionChanges)},
            {"jitter", jitter},
        };
    }

}
