#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// External stop signal for one load. Cancelling wakes any waitFor() sleeper.
class CancellationToken {
public:
    void cancel();

    bool cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    // Sleeps up to timeout; returns true if cancellation arrived first.
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};
