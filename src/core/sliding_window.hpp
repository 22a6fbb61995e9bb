#pragma once

#include <cstddef>
#include <deque>
#include "clock.hpp"

namespace trade_gate {

struct WindowLimits {
    size_t per_second{0};
    size_t per_minute{0};
};

/**
 * Ordered (oldest-first) record of recent call timestamps for one call class.
 * Not synchronized; the owner serializes access.
 */
class SlidingWindowCounter {
public:
    static constexpr std::chrono::seconds kShortWindow{1};
    static constexpr std::chrono::seconds kLongWindow{60};

    // Drop records strictly older than the long window.
    void prune(SteadyTime now);

    // Records no older than `window` (a record exactly `window` old still counts).
    size_t count_within(SteadyTime now, Duration window) const;

    // True if one more record at `now` keeps both windows within `limits`.
    bool has_headroom(SteadyTime now, const WindowLimits& limits) const;

    void push(SteadyTime ts) { records_.push_back(ts); }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

private:
    std::deque<SteadyTime> records_;
};

} // namespace trade_gate
