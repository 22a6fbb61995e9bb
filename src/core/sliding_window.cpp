#include "sliding_window.hpp"
#include <algorithm>

namespace trade_gate {

void SlidingWindowCounter::prune(SteadyTime now) {
    while (!records_.empty() && now - records_.front() > kLongWindow) {
        records_.pop_front();
    }
}

size_t SlidingWindowCounter::count_within(SteadyTime now, Duration window) const {
    // The combined sequence is fed from several locks and may be slightly out of
    // order, so scan everything rather than stopping at the first old record.
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
        [&](SteadyTime ts) { return now - ts <= window; }));
}

bool SlidingWindowCounter::has_headroom(SteadyTime now, const WindowLimits& limits) const {
    if (count_within(now, kShortWindow) >= limits.per_second) return false;
    if (count_within(now, kLongWindow) >= limits.per_minute) return false;
    return true;
}

} // namespace trade_gate
