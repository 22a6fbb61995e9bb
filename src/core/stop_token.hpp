#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace trade_gate {

/**
 * Cooperative cancellation flag shared between a controller and the loops it owns.
 * Sleeping loops wait on it so that a stop request wakes them immediately.
 */
class StopToken {
public:
    StopToken() = default;

    StopToken(const StopToken&) = delete;
    StopToken& operator=(const StopToken&) = delete;

    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopped_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool stop_requested() const { return stopped_.load(std::memory_order_acquire); }

    // Blocks up to `d`; returns true if stop was requested (before or during the wait).
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> d) const {
        std::unique_lock<std::mutex> lock(mu_);
        return cv_.wait_for(lock, d, [this] {
            return stopped_.load(std::memory_order_acquire);
        });
    }

private:
    std::atomic<bool> stopped_{false};
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
};

} // namespace trade_gate
