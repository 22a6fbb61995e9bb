#pragma once

#include <chrono>
#include <thread>
#include "stop_token.hpp"

namespace trade_gate {

using SteadyTime = std::chrono::steady_clock::time_point;
using Duration = std::chrono::steady_clock::duration;
using Timestamp = std::chrono::system_clock::time_point;

/**
 * Time source used by the rate limiter and session bookkeeping.
 * Production code uses SteadyClock; tests substitute a manual clock so that
 * window and backoff behaviour can be checked without real sleeps.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual SteadyTime now() const = 0;

    // Sleep for `d`. Returns false if `stop` was requested before the sleep finished.
    virtual bool sleep_for(Duration d, const StopToken* stop) = 0;
};

class SteadyClock : public Clock {
public:
    SteadyTime now() const override { return std::chrono::steady_clock::now(); }

    bool sleep_for(Duration d, const StopToken* stop) override {
        if (stop) {
            return !stop->wait_for(d);
        }
        std::this_thread::sleep_for(d);
        return true;
    }
};

inline double to_seconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

inline Duration from_seconds(double s) {
    return std::chrono::duration_cast<Duration>(std::chrono::duration<double>(s));
}

} // namespace trade_gate
