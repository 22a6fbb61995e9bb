#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <thread>
#include "../../src/session/trading_engine.hpp"

namespace trade_gate {
namespace testing {

class CountingStrategy : public Strategy {
public:
    void on_signal_tick(TradingContext& ctx) override {
        if (ctx.client) saw_client = true;
        if (throw_on_signal) throw std::runtime_error("signal failed");
        ++signal_ticks;
    }

    void on_position_tick(TradingContext&) override { ++position_ticks; }

    uint64_t total() const { return signal_ticks.load() + position_ticks.load(); }

    std::atomic<uint64_t> signal_ticks{0};
    std::atomic<uint64_t> position_ticks{0};
    std::atomic<bool> saw_client{false};
    std::atomic<bool> throw_on_signal{false};
};

/**
 * Signal tick that keeps working for `tick_ms` without looking at the stop
 * token, like an exchange call already on the wire.
 */
class SlowTickStrategy : public Strategy {
public:
    explicit SlowTickStrategy(int tick_ms) : tick_ms_(tick_ms) {}

    void on_signal_tick(TradingContext&) override {
        ++started;
        std::this_thread::sleep_for(std::chrono::milliseconds(tick_ms_));
        ++completed;
    }

    void on_position_tick(TradingContext&) override {}

    std::atomic<int> started{0};
    std::atomic<int> completed{0};

private:
    int tick_ms_;
};

inline EngineConfig fast_engine() {
    EngineConfig cfg;
    cfg.signal_interval_seconds = 0.01;
    cfg.position_interval_seconds = 0.01;
    cfg.error_backoff_seconds = 0.01;
    return cfg;
}

} // namespace testing
} // namespace trade_gate
