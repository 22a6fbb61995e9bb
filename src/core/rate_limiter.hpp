#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "backoff.hpp"
#include "clock.hpp"
#include "sliding_window.hpp"
#include "stop_token.hpp"

namespace trade_gate {

/**
 * Exchange call classes with independent ceilings.
 * REST covers read calls (ticker, candles, account queries); ORDER covers
 * order placement and cancellation.
 */
enum class CallClass { REST, ORDER };

const char* to_string(CallClass cls);

struct RateLimitConfig {
    WindowLimits rest{10, 600};
    WindowLimits order{8, 200};
    BackoffPolicy rest_backoff{BackoffPolicy::rest()};
    BackoffPolicy order_backoff{BackoffPolicy::order()};
    BackoffPolicy throttle_backoff{BackoffPolicy::throttle()};
};

struct RemainingCapacity {
    int rest_per_second{0};
    int rest_per_minute{0};
    int order_per_second{0};
    int order_per_minute{0};
    size_t total_last_second{0};
    size_t total_last_minute{0};

    nlohmann::json to_json() const;
};

/**
 * Process-wide admission control for exchange calls.
 *
 * Each call class keeps its own sliding window guarded by its own mutex; a
 * separate combined window tracks every recorded call for the account. Denial
 * is backpressure, never an error: callers wait in await_slot()/acquire().
 */
class RateLimiter {
public:
    explicit RateLimiter(RateLimitConfig cfg = {}, std::shared_ptr<Clock> clock = nullptr);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Prunes stale records and reports whether both windows have headroom.
    bool admit(CallClass cls);

    // Blocks the calling worker until admit() holds. Returns false only if `stop` fired.
    bool await_slot(CallClass cls, const StopToken* stop = nullptr);

    // Record one issued call in the class window and the combined window.
    void record(CallClass cls);

    // await_slot + record with the check and the record done under one lock hold,
    // so concurrent producers cannot overshoot the caps.
    bool acquire(CallClass cls, const StopToken* stop = nullptr);

    template <typename Op>
    auto execute(CallClass cls, Op&& op) -> decltype(op()) {
        acquire(cls);
        return op();
    }

    /**
     * Secondary ladder used after the exchange answered 429 despite local
     * admission. Sleeps 2s, 4s, 8s, 16s, re-probing admit() after each step.
     * Returns true once admission is available again; false when the ladder is
     * exhausted or `stop` fired. Local caps are left untouched.
     */
    bool await_after_throttle(CallClass cls, const StopToken* stop = nullptr);

    RemainingCapacity remaining_capacity();

    const RateLimitConfig& config() const { return cfg_; }
    Clock& clock() { return *clock_; }

private:
    struct Lane {
        WindowLimits limits;
        BackoffPolicy backoff;
        SlidingWindowCounter window;
        std::mutex mu;
    };

    Lane& lane(CallClass cls) { return cls == CallClass::ORDER ? order_ : rest_; }
    bool try_acquire(CallClass cls);
    bool wait_loop(CallClass cls, bool take, const StopToken* stop);
    void record_total(SteadyTime ts);

    RateLimitConfig cfg_;
    std::shared_ptr<Clock> clock_;
    Lane rest_;
    Lane order_;
    SlidingWindowCounter total_;
    std::mutex total_mu_;
};

} // namespace trade_gate
