#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace BehaviorSentinel {

    /**
     * @brief Event timestamps within a fixed time horizon
     *
     * prune(now) drops every timestamp older than now - horizon.
     */
    class SlidingTimeWindow {
    public:
        explicit SlidingTimeWindow(int64_t horizonMs);

        void push(int64_t timestampMs);
        void prune(int64_t nowMs);
        void clear();

        size_t count() const { return timestamps_.size(); }
        int64_t horizonMs() const { return horizonMs_; }

        /// Events per minute over the horizon
        double ratePerMinute() const;

    private:
        int64_t horizonMs_;
        std::deque<int64_t> timestamps_;
    };

}
