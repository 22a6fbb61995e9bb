#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/clock.hpp"
#include "../core/config.hpp"
#include "../core/rate_limiter.hpp"
#include "../core/stop_token.hpp"
#include "../exchange/exchange_client.hpp"

namespace trade_gate {

class UserSession;

/**
 * What a strategy sees on each tick. `client` is null once the session has
 * been torn down or before login completed; strategies must check it.
 */
struct TradingContext {
    int64_t user_id;
    std::shared_ptr<ExchangeClient> client;
    RateLimiter& limiter;
    const StopToken& stop;
};

/**
 * Trading logic plugged into a session's engine. Implemented outside this
 * library; called from the engine's loop threads.
 */
class Strategy {
public:
    virtual ~Strategy() = default;
    virtual void on_signal_tick(TradingContext& ctx) = 0;
    virtual void on_position_tick(TradingContext& ctx) = 0;
};

/**
 * Per-session engine binding. Runs a signal loop and a position loop, each on
 * its own thread, until stopped. Stop is cooperative: loops observe the stop
 * token between iterations and inside their sleeps.
 */
class TradingEngine {
public:
    TradingEngine(int64_t user_id,
                  std::weak_ptr<UserSession> session,
                  std::shared_ptr<RateLimiter> limiter,
                  EngineConfig cfg = {});
    ~TradingEngine();

    TradingEngine(const TradingEngine&) = delete;
    TradingEngine& operator=(const TradingEngine&) = delete;

    // Returns false if already running or if the owning session is gone or torn down.
    bool start(std::shared_ptr<Strategy> strategy);

    // Flag non-running and wake sleeping loops. The loop threads stay owned by
    // the engine so a later stop() can join them.
    void signal_stop();

    // signal_stop() and drop the loop threads without waiting; each loop exits
    // at its next observed iteration boundary.
    void request_stop();

    // Signal stop and wait until every loop started so far has returned.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }
    nlohmann::json status() const;

private:
    enum class LoopKind { SIGNAL, POSITION };

    struct LoopState {
        int64_t user_id;
        std::weak_ptr<UserSession> session;
        std::shared_ptr<RateLimiter> limiter;
        std::shared_ptr<Strategy> strategy;
        StopToken stop;
        std::atomic<uint64_t> signal_ticks{0};
        std::atomic<uint64_t> position_ticks{0};
        std::atomic<uint64_t> errors{0};
    };

    static void run_loop(std::shared_ptr<LoopState> st, LoopKind kind,
                         std::chrono::milliseconds interval,
                         std::chrono::milliseconds error_backoff);
    void signal_stop_locked();
    std::vector<std::thread> take_threads();

    int64_t user_id_;
    std::weak_ptr<UserSession> session_;
    std::shared_ptr<RateLimiter> limiter_;
    EngineConfig cfg_;

    mutable std::mutex mu_;
    std::shared_ptr<LoopState> state_;
    std::vector<std::thread> loops_;
    std::optional<Timestamp> started_at_;
    std::atomic<bool> running_{false};
};

} // namespace trade_gate
