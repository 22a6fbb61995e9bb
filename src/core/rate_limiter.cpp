#include "rate_limiter.hpp"
#include <spdlog/spdlog.h>

namespace trade_gate {

const char* to_string(CallClass cls) {
    return cls == CallClass::ORDER ? "order" : "rest";
}

nlohmann::json RemainingCapacity::to_json() const {
    return nlohmann::json{
        {"rest_remaining_per_second", rest_per_second},
        {"rest_remaining_per_minute", rest_per_minute},
        {"order_remaining_per_second", order_per_second},
        {"order_remaining_per_minute", order_per_minute},
        {"total_last_second", total_last_second},
        {"total_last_minute", total_last_minute}
    };
}

RateLimiter::RateLimiter(RateLimitConfig cfg, std::shared_ptr<Clock> clock)
    : cfg_(cfg)
    , clock_(clock ? std::move(clock) : std::make_shared<SteadyClock>()) {
    rest_.limits = cfg_.rest;
    rest_.backoff = cfg_.rest_backoff;
    order_.limits = cfg_.order;
    order_.backoff = cfg_.order_backoff;
}

bool RateLimiter::admit(CallClass cls) {
    auto& l = lane(cls);
    std::lock_guard<std::mutex> lock(l.mu);
    auto now = clock_->now();
    l.window.prune(now);
    return l.window.has_headroom(now, l.limits);
}

bool RateLimiter::try_acquire(CallClass cls) {
    auto& l = lane(cls);
    SteadyTime now;
    {
        std::lock_guard<std::mutex> lock(l.mu);
        now = clock_->now();
        l.window.prune(now);
        if (!l.window.has_headroom(now, l.limits)) return false;
        l.window.push(now);
    }
    record_total(now);
    return true;
}

void RateLimiter::record(CallClass cls) {
    auto& l = lane(cls);
    SteadyTime now;
    {
        std::lock_guard<std::mutex> lock(l.mu);
        now = clock_->now();
        l.window.push(now);
    }
    record_total(now);
}

void RateLimiter::record_total(SteadyTime ts) {
    std::lock_guard<std::mutex> lock(total_mu_);
    total_.prune(ts);
    total_.push(ts);
}

bool RateLimiter::wait_loop(CallClass cls, bool take, const StopToken* stop) {
    const auto& policy = lane(cls).backoff;
    int denials = 0;
    while (!(take ? try_acquire(cls) : admit(cls))) {
        ++denials;
        auto delay = policy.delay_for(denials);
        if (policy.should_warn(denials)) {
            spdlog::warn("RateLimiter: {} slot still unavailable after {} checks, backing off up to {:.1f}s per check",
                         to_string(cls), denials, policy.max_seconds);
        }
        if (!clock_->sleep_for(delay, stop)) {
            spdlog::debug("RateLimiter: {} wait cancelled after {} checks", to_string(cls), denials);
            return false;
        }
    }
    if (policy.warn_after > 0 && denials > policy.warn_after) {
        spdlog::info("RateLimiter: {} slot granted after {} checks", to_string(cls), denials);
    }
    return true;
}

bool RateLimiter::await_slot(CallClass cls, const StopToken* stop) {
    return wait_loop(cls, false, stop);
}

bool RateLimiter::acquire(CallClass cls, const StopToken* stop) {
    return wait_loop(cls, true, stop);
}

bool RateLimiter::await_after_throttle(CallClass cls, const StopToken* stop) {
    const auto& policy = cfg_.throttle_backoff;
    for (int step = 1; !policy.exhausted(step); ++step) {
        auto delay = policy.delay_for(step);
        spdlog::warn("RateLimiter: exchange throttled {} calls, backing off {:.1f}s", to_string(cls),
                     to_seconds(delay));
        if (!clock_->sleep_for(delay, stop)) return false;
        if (admit(cls)) {
            spdlog::info("RateLimiter: {} calls may resume", to_string(cls));
            return true;
        }
    }
    spdlog::warn("RateLimiter: {} throttle backoff exhausted without headroom", to_string(cls));
    return false;
}

RemainingCapacity RateLimiter::remaining_capacity() {
    RemainingCapacity out;
    auto now = clock_->now();
    auto fill = [&](Lane& l, int& per_second, int& per_minute) {
        std::lock_guard<std::mutex> lock(l.mu);
        l.window.prune(now);
        per_second = static_cast<int>(l.limits.per_second)
            - static_cast<int>(l.window.count_within(now, SlidingWindowCounter::kShortWindow));
        per_minute = static_cast<int>(l.limits.per_minute) - static_cast<int>(l.window.size());
    };
    fill(rest_, out.rest_per_second, out.rest_per_minute);
    fill(order_, out.order_per_second, out.order_per_minute);
    {
        std::lock_guard<std::mutex> lock(total_mu_);
        total_.prune(now);
        out.total_last_second = total_.count_within(now, SlidingWindowCounter::kShortWindow);
        out.total_last_minute = total_.size();
    }
    return out;
}

} // namespace trade_gate
