#include "FeatureExtractor.h"
#include <algorithm>
#include <cmath>

namespace BehaviorSentinel {

    namespace {

        double segmentLength(const TouchSample& a, const TouchSample& b) {
            double dx = static_cast<double>(b.x) - a.x;
            double dy = static_cast<double>(b.y) - a.y;
            return std::sqrt(dx * dx + dy * dy);
        }

    }

    GestureType FeatureExtractor::classify(const std::vector<TouchSample>& path) {
        if (path.empty()) {
            return GestureType::TAP;
        }
        const auto& start = path.front();
        const auto& end = path.back();
        double movement = segmentLength(start, end);
        int64_t duration = end.timestampMs - start.timestampMs;

        if (movement <= TAP_MOVEMENT_THRESHOLD && duration <= TAP_DURATION_THRESHOLD_MS) {
            return GestureType::TAP;
        }
        return GestureType::SWIPE;
    }

    GestureFeatures FeatureExtractor::extract(const std::vector<TouchSample>& path) {
        GestureFeatures features;
        if (path.size() < 2) {
            return features;
        }

        features.startMs = path.front().timestampMs;
        features.endMs = path.back().timestampMs;
        features.pointerId = path.front().pointerId;
        features.type = classify(path);

        features.totalDistance = totalDistance(path);
        int64_t duration = features.durationMs();
        features.avgVelocity = duration > 0 ? features.totalDistance / static_cast<double>(duration) : 0.0;
        features.peakVelocity = peakVelocity(path);

        double pressureSum = 0.0;
        double pressurePeak = 0.0;
        for (const auto& sample : path) {
            pressureSum += sample.pressure;
            pressurePeak = std::max(pressurePeak, static_cast<double>(sample.pressure));
        }
        features.avgPressure = pressureSum / static_cast<double>(path.size());
        features.peakPressure = pressurePeak;

        features.pathDeviation = pathDeviation(path);
        features.directionChanges = directionChanges(path);
        features.jitter = jitter(path);
        return features;
    }

    double FeatureExtractor::totalDistance(const std::vector<TouchSample>& path) {
        double distance = 0.0;
        for (size_t i = 1; i < path.size(); ++i) {
            distance += segmentLength(path[i - 1], path[i]);
        }
        return distance;
    }

    double FeatureExtractor::peakVelocity(const std::vector<TouchSample>& path) {
        double peak = 0.0;
        for (size_t i = 1; i < path.size(); ++i) {
            int64_t dt = path[i].timestampMs - path[i - 1].timestampMs;
            if (dt <= 0) continue;
            peak = std::max(peak, segmentLength(path[i - 1], path[i]) / static_cast<double>(dt));
        }
        return peak;
    }

    double FeatureExtractor::distanceToChord(const TouchSample& start, const TouchSample& end,
                                             const TouchSample& point) {
        double x1 = start.x, y1 = start.y;
        double x2 = end.x, y2 = end.y;
        double length = std::sqrt((x2 - x1) * (x2 - x1) + (y2 - y1) * (y2 - y1));
        if (length == 0.0) {
            return 0.0;
        }
        return std::abs((y2 - y1) * point.x - (x2 - x1) * point.y + x2 * y1 - y2 * x1) / length;
    }

    std::vector<double> FeatureExtractor::interiorDeviations(const std::vector<TouchSample>& path) {
        std::vector<double> deviations;
        if (path.size() < 3) {
            return deviations;
        }
        deviations.reserve(path.size() - 2);
        for (size_t i = 1; i + 1 < path.size(); ++i) {
            deviations.push_back(distanceToChord(path.front(), path.back(), path[i]));
        }
        return deviations;
    }

    double FeatureExtractor::pathDeviation(const std::vector<TouchSample>& path) {
        auto deviations = interiorDeviations(path);
        if (deviations.empty()) return 0.0;

        double sum = 0.0;
        for (double d : deviations) sum += d;
        return sum / static_cast<double>(deviations.size());
    }

    int FeatureExtractor::directionChanges(const std::vector<TouchSample>& path) {
        if (path.size() < 3) return 0;

        int changes = 0;
        for (size_t i = 2; i < path.size(); ++i) {
            const auto& p1 = path[i - 2];
            const auto& p2 = path[i - 1];
            const auto& p3 = path[i];
            double angle1 = std::atan2(static_cast<double>(p2.y) - p1.y, static_cast<double>(p2.x) - p1.x);
            double angle2 = std::atan2(static_cast<double>(p3.y) - p2.y, static_cast<double>(p3.x) - p2.x);
            // No wrap-around: a turn across the +-pi seam counts as a change.
            if (std::abs(angle2 - angle1) > DIRECTION_CHANGE_RADIANS) {
                ++changes;
            }
        }
        return changes;
    }

    double FeatureExtractor::jitter(const std::vector<TouchSample>& path) {
        auto deviations = interiorDeviations(path);
        if (deviations.empty()) return 0.0;

        double mean = 0.0;
        for (double d : deviations) mean += d;
        mean /= static_cast<double>(deviations.size());

        double variance = 0.0;
        for (double d : deviations) variance += (d - mean) * (d - mean);
        variance /= static_cast<double>(deviations.size());
        return std::sqrt(variance);
    }

}
