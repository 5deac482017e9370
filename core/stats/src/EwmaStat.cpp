#include "EwmaStat.h"
#include <algorithm>
#include <cmath>

namespace BehaviorSentinel {

    EwmaStat::EwmaStat(double alpha) : alpha_(alpha) {}

    EwmaStat::Snapshot EwmaStat::update(double value) {
        mean_ = alpha_ * value + (1.0 - alpha_) * mean_;
        double deviation = value - mean_;
        variance_ = alpha_ * deviation * deviation + (1.0 - alpha_) * variance_;
        return {mean_, variance_};
    }

    double EwmaStat::stddev() const {
        return std::max(STDDEV_EPSILON, std::sqrt(variance_));
    }

    double EwmaStat::zScore(double value) const {
        return std::abs(value - mean_) / stddev();
    }

    void EwmaStat::restore(double mean, double variance) {
        mean_ = mean;
        variance_ = variance;
    }

    void EwmaStat::reset() {
        mean_ = 0.0;
        variance_ = 0.0;
    }

}
