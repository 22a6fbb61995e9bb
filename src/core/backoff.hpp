#pragma once

#include <algorithm>
#include <cmath>
#include "clock.hpp"

namespace trade_gate {

/**
 * Geometric backoff: delay(n) = min(initial * multiplier^(n-1), max) for the
 * n-th consecutive denial (n >= 1). The sequence is non-decreasing and never
 * exceeds `max_seconds`.
 */
struct BackoffPolicy {
    double initial_seconds{0.2};
    double multiplier{1.2};
    double max_seconds{6.0};
    int warn_after{20};     // warn once, when the streak first passes this many denials (0 = never)
    int max_attempts{0};    // 0 = unbounded

    Duration delay_for(int attempt) const {
        if (attempt < 1) attempt = 1;
        double d = initial_seconds * std::pow(multiplier, attempt - 1);
        if (!std::isfinite(d)) d = max_seconds;
        return from_seconds(std::min(d, max_seconds));
    }

    bool should_warn(int attempt) const {
        return warn_after > 0 && attempt == warn_after + 1;
    }

    bool exhausted(int attempt) const {
        return max_attempts > 0 && attempt > max_attempts;
    }

    static BackoffPolicy rest() { return BackoffPolicy{0.2, 1.2, 6.0, 20, 0}; }
    static BackoffPolicy order() { return BackoffPolicy{0.3, 1.5, 10.0, 15, 0}; }
    // Secondary ladder after the exchange itself answered 429: 2s, 4s, 8s, 16s.
    static BackoffPolicy throttle() { return BackoffPolicy{2.0, 2.0, 16.0, 0, 4}; }
};

} // namespace trade_gate
