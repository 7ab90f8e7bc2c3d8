#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace taskpool {

// Multi-producer channel with a fixed capacity. A push into a full channel
// evicts the oldest value, so producers never block on a slow consumer.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    void push(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (values_.size() >= capacity_) {
            values_.pop_front();
            ++dropped_;
        }
        values_.push_back(std::move(value));
    }

    std::vector<T> drain() {
        std::vector<T> out;
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(values_.size());
        for (T& value : values_) {
            out.push_back(std::move(value));
        }
        values_.clear();
        return out;
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.empty();
    }

    [[nodiscard]] std::size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<T> values_;
    std::size_t dropped_ = 0;
};

}  // namespace taskpool
