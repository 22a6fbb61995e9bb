#include "trading_engine.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "user_session.hpp"
#include "../core/utils.hpp"

namespace trade_gate {

namespace {

std::chrono::milliseconds to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

} // namespace

TradingEngine::TradingEngine(int64_t user_id,
                             std::weak_ptr<UserSession> session,
                             std::shared_ptr<RateLimiter> limiter,
                             EngineConfig cfg)
    : user_id_(user_id)
    , session_(std::move(session))
    , limiter_(std::move(limiter))
    , cfg_(cfg) {}

TradingEngine::~TradingEngine() {
    request_stop();
}

bool TradingEngine::start(std::shared_ptr<Strategy> strategy) {
    if (!strategy) {
        throw std::invalid_argument("TradingEngine::start requires a strategy");
    }
    std::lock_guard<std::mutex> lock(mu_);
    if (running_.load(std::memory_order_acquire)) {
        spdlog::warn("Engine for user {} already running", user_id_);
        return false;
    }
    {
        auto session = session_.lock();
        if (!session || session->torn_down()) {
            spdlog::warn("Engine for user {} not started: session is closed", user_id_);
            return false;
        }
    }
    auto st = std::make_shared<LoopState>();
    st->user_id = user_id_;
    st->session = session_;
    st->limiter = limiter_;
    st->strategy = std::move(strategy);
    state_ = st;

    auto error_backoff = to_ms(cfg_.error_backoff_seconds);
    loops_.emplace_back(&TradingEngine::run_loop, st, LoopKind::SIGNAL,
                        to_ms(cfg_.signal_interval_seconds), error_backoff);
    loops_.emplace_back(&TradingEngine::run_loop, st, LoopKind::POSITION,
                        to_ms(cfg_.position_interval_seconds), error_backoff);
    started_at_ = std::chrono::system_clock::now();
    running_.store(true, std::memory_order_release);
    spdlog::info("Engine started for user {}", user_id_);
    return true;
}

void TradingEngine::signal_stop_locked() {
    running_.store(false, std::memory_order_release);
    if (state_) state_->stop.request_stop();
    started_at_.reset();
}

void TradingEngine::signal_stop() {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_.load(std::memory_order_acquire)) return;
    signal_stop_locked();
    spdlog::info("Engine for user {} signalled to stop", user_id_);
}

std::vector<std::thread> TradingEngine::take_threads() {
    std::lock_guard<std::mutex> lock(mu_);
    signal_stop_locked();
    std::vector<std::thread> out;
    out.swap(loops_);
    return out;
}

void TradingEngine::request_stop() {
    auto threads = take_threads();
    for (auto& t : threads) {
        if (t.joinable()) t.detach();
    }
    if (!threads.empty()) {
        spdlog::info("Engine for user {} flagged to stop ({} loops released)", user_id_, threads.size());
    }
}

void TradingEngine::stop() {
    auto threads = take_threads();
    for (auto& t : threads) {
        if (!t.joinable()) continue;
        if (t.get_id() == std::this_thread::get_id()) {
            // A strategy stopping its own engine cannot join itself.
            t.detach();
        } else {
            t.join();
        }
    }
    if (!threads.empty()) {
        spdlog::info("Engine for user {} stopped, {} loops joined", user_id_, threads.size());
    }
}

nlohmann::json TradingEngine::status() const {
    std::lock_guard<std::mutex> lock(mu_);
    nlohmann::json out{
        {"is_running", running_.load(std::memory_order_acquire)},
        {"started_at", started_at_ ? utils::ts_to_iso(*started_at_) : ""},
        {"signal_ticks", 0},
        {"position_ticks", 0},
        {"errors", 0}
    };
    if (state_) {
        out["signal_ticks"] = state_->signal_ticks.load();
        out["position_ticks"] = state_->position_ticks.load();
        out["errors"] = state_->errors.load();
    }
    return out;
}

void TradingEngine::run_loop(std::shared_ptr<LoopState> st, LoopKind kind,
                             std::chrono::milliseconds interval,
                             std::chrono::milliseconds error_backoff) {
    const char* name = kind == LoopKind::SIGNAL ? "signal" : "position";
    spdlog::debug("Engine {} loop started for user {}", name, st->user_id);

    while (!st->stop.stop_requested()) {
        std::shared_ptr<ExchangeClient> client;
        {
            auto session = st->session.lock();
            if (!session || session->torn_down()) break;
            client = session->client_handle().client();
        }
        TradingContext ctx{st->user_id, std::move(client), *st->limiter, st->stop};
        try {
            if (kind == LoopKind::SIGNAL) {
                st->strategy->on_signal_tick(ctx);
                st->signal_ticks.fetch_add(1);
            } else {
                st->strategy->on_position_tick(ctx);
                st->position_ticks.fetch_add(1);
            }
        } catch (const OperationCancelled&) {
            break;
        } catch (const std::exception& e) {
            st->errors.fetch_add(1);
            spdlog::error("Engine {} loop error for user {}: {}", name, st->user_id, e.what());
            if (st->stop.wait_for(error_backoff)) break;
            continue;
        }
        if (st->stop.wait_for(interval)) break;
    }
    spdlog::debug("Engine {} loop exited for user {}", name, st->user_id);
}

} // namespace trade_gate
