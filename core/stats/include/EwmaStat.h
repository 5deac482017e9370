#pragma once

namespace BehaviorSentinel {

    /**
     * @brief Exponentially weighted mean and variance of one feature
     *
     * mean_t     = a*x + (1-a)*mean_{t-1}
     * variance_t = a*(x - mean_t)^2 + (1-a)*variance_{t-1}
     *
     * The variance uses the deviation from the already-updated mean.
     */
    class EwmaStat {
    public:
        static constexpr double DEFAULT_ALPHA = 0.1;
        static constexpr double STDDEV_EPSILON = 1e-6;

        struct Snapshot {
            double mean;
            double variance;
        };

        explicit EwmaStat(double alpha = DEFAULT_ALPHA);

        Snapshot update(double value);

        double mean() const { return mean_; }
        double variance() const { return variance_; }
        double alpha() const { return alpha_; }

        /// sqrt(variance), never below STDDEV_EPSILON
        double stddev() const;

        /// |value - mean| / stddev()
        double zScore(double value) const;

        void restore(double mean, double variance);
        void reset();

    private:
        double alpha_;
        double mean_ = 0.0;
        double variance_ = 0.0;
    };

}
