#pragma once

#include <cstddef>
#include <deque>
#include <vector>

namespace BehaviorSentinel {

    /**
     * @brief Fixed-capacity FIFO; pushing past capacity evicts the oldest item
     *
     * Iteration is in insertion order. Not thread-safe; owners lock around it.
     */
    template<typename T>
    class BoundedWindow {
    public:
        using const_iterator = typename std::deque<T>::const_iterator;

        explicit BoundedWindow(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

        void push(T item) {
            items_.push_back(std::move(item));
            while (items_.size() > capacity_) {
                items_.pop_front();
            }
        }

        void clear() { items_.clear(); }

        size_t size() const { return items_.size(); }
        size_t capacity() const { return capacity_; }
        bool empty() const { return items_.empty(); }

        const T& front() const { return items_.front(); }
        const T& back() const { return items_.back(); }

        const_iterator begin() const { return items_.begin(); }
        const_iterator end() const { return items_.end(); }

        std::vector<T> snapshot() const { return std::vector<T>(items_.begin(), items_.end()); }

        /// Plain mean of proj(item); 0 when empty
        template<typename Proj>
        double mean(Proj proj) const {
            if (items_.empty()) return 0.0;
            double sum = 0.0;
            for (const auto& item : items_) {
                sum += static_cast<double>(proj(item));
            }
            return sum / static_cast<double>(items_.size());
        }

        double mean() const {
            return mean([](const T& item) { return item; });
        }

        /// Population variance of proj(item); 0 when empty
        template<typename Proj>
        double variance(Proj proj) const {
            if (items_.empty()) return 0.0;
            double m = mean(proj);
            double sum = 0.0;
            for (const auto& item : items_) {
                double d = static_cast<double>(proj(item)) - m;
                sum += d * d;
            }
            return sum / static_cast<double>(items_.size());
        }

        double variance() const {
            return variance([](const T& item) { return item; });
        }

        template<typename Pred>
        size_t countIf(Pred pred) const {
            size_t n = 0;
            for (const auto& item : items_) {
                if (pred(item)) ++n;
            }
            return n;
        }

    private:
        size_t capacity_;
        std::deque<T> items_;
    };

}
