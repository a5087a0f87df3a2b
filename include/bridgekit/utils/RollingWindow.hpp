#pragma once
#include <cstddef>
#include <deque>
#include <numeric>
#include <type_traits>
#include <utility>
#include <vector>

namespace BK {

/**
 * RollingWindow: fixed-capacity buffer of the most recent samples.
 *
 * Pushing into a full window evicts the oldest sample. A capacity of zero
 * is treated as one so the window always retains the latest sample.
 * Not thread-safe; owners guard it with their own lock.
 */
template <typename T>
class RollingWindow {
public:
    explicit RollingWindow(std::size_t capacity = 100)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    void push(T value) {
        samples_.push_back(std::move(value));
        while (samples_.size() > capacity_) {
            samples_.pop_front();
        }
    }

    void clear() {
        samples_.clear();
    }

    [[nodiscard]] auto size() const -> std::size_t { return samples_.size(); }
    [[nodiscard]] auto empty() const -> bool { return samples_.empty(); }
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

    [[nodiscard]] auto back() const -> T const& { return samples_.back(); }
    [[nodiscard]] auto front() const -> T const& { return samples_.front(); }

    [[nodiscard]] auto average() const -> double
        requires std::is_arithmetic_v<T>
    {
        if (samples_.empty()) {
            return 0.0;
        }
        auto const sum = std::accumulate(samples_.begin(), samples_.end(), 0.0);
        return sum / static_cast<double>(samples_.size());
    }

    [[nodiscard]] auto toVector() const -> std::vector<T> {
        return std::vector<T>(samples_.begin(), samples_.end());
    }

    // Most recent `count` samples, oldest first.
    [[nodiscard]] auto tail(std::size_t count) const -> std::vector<T> {
        auto const n = count < samples_.size() ? count : samples_.size();
        return std::vector<T>(samples_.end() - static_cast<std::ptrdiff_t>(n), samples_.end());
    }

    auto begin() const { return samples_.begin(); }
    auto end() const { return samples_.end(); }

private:
    std::size_t   capacity_;
    std::deque<T> samples_;
};

} // namespace BK
