#include "SlidingTimeWindow.h"

namespace BehaviorSentinel {

    SlidingTimeWindow::SlidingTimeWindow(int64_t horizonMs) : horizonMs_(horizonMs) {}

    void SlidingTimeWindow::push(int64_t timestampMs) {
        timestamps_.push_back(timestampMs);
    }

    void SlidingTimeWindow::prune(int64_t nowMs) {
        int64_t cutoff = nowMs - horizonMs_;
        while (!timestamps_.empty() && timestamps_.front() < cutoff) {
            timestamps_.pop_front();
        }
    }

    void SlidingTimeWindow::clear() {
        timestamps_.clear();
    }

    double SlidingTimeWindow::ratePerMinute() const {
        double minutes = static_cast<double>(horizonMs_) / 60000.0;
        if (minutes <= 0.0) return 0.0;
        return static_cast<double>(timestamps_.size()) / minutes;
    }

}
