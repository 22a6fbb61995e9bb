#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "rate_limiter.hpp"

namespace trade_gate {

using json = nlohmann::json;

struct ServiceConfig {
    uint16_t control_port{8000};
    std::string bind_address{"127.0.0.1"};
    int threads{2};
    int worker_threads{4};   // login/logout work runs here, off the IO threads
};

struct ExchangeConfig {
    std::string base_url{"https://api.upbit.com"};
    double timeout_seconds{10.0};
    int max_throttle_retries{3};   // retries after a 429 before RateLimitExceeded is raised
};

struct EngineConfig {
    double signal_interval_seconds{60.0};
    double position_interval_seconds{10.0};
    double error_backoff_seconds{30.0};   // pause after a strategy iteration throws
};

struct SessionsConfig {
    double max_idle_hours{24.0};
    int sweep_interval_seconds{300};
    EngineConfig engine;
};

struct LoggingConfig {
    std::string level{"info"};
};

struct AuthConfig {
    std::string token{};
};

struct Config {
    ServiceConfig services;
    ExchangeConfig exchange;
    RateLimitConfig rate_limits;
    SessionsConfig sessions;
    LoggingConfig logging;
    AuthConfig auth;
};

inline void load_window(const json& j, WindowLimits& w) {
    w.per_second = j.value("per_second", w.per_second);
    w.per_minute = j.value("per_minute", w.per_minute);
}

inline void load_backoff(const json& j, BackoffPolicy& b) {
    b.initial_seconds = j.value("initial_seconds", b.initial_seconds);
    b.multiplier = j.value("multiplier", b.multiplier);
    b.max_seconds = j.value("max_seconds", b.max_seconds);
    b.warn_after = j.value("warn_after", b.warn_after);
    b.max_attempts = j.value("max_attempts", b.max_attempts);
}

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j = json::parse(f, nullptr, true, true);
    if (j.contains("services")) {
        auto& svc = j["services"];
        cfg.services.control_port = svc.value("control_port", cfg.services.control_port);
        cfg.services.bind_address = svc.value("bind_address", cfg.services.bind_address);
        cfg.services.threads = svc.value("threads", cfg.services.threads);
        cfg.services.worker_threads = svc.value("worker_threads", cfg.services.worker_threads);
    }
    if (j.contains("exchange")) {
        auto& ex = j["exchange"];
        cfg.exchange.base_url = ex.value("base_url", cfg.exchange.base_url);
        cfg.exchange.timeout_seconds = ex.value("timeout_seconds", cfg.exchange.timeout_seconds);
        cfg.exchange.max_throttle_retries = ex.value("max_throttle_retries", cfg.exchange.max_throttle_retries);
    }
    if (j.contains("rate_limits")) {
        auto& rl = j["rate_limits"];
        if (rl.contains("rest")) load_window(rl["rest"], cfg.rate_limits.rest);
        if (rl.contains("order")) load_window(rl["order"], cfg.rate_limits.order);
        if (rl.contains("rest_backoff")) load_backoff(rl["rest_backoff"], cfg.rate_limits.rest_backoff);
        if (rl.contains("order_backoff")) load_backoff(rl["order_backoff"], cfg.rate_limits.order_backoff);
        if (rl.contains("throttle_backoff")) load_backoff(rl["throttle_backoff"], cfg.rate_limits.throttle_backoff);
    }
    if (j.contains("sessions")) {
        auto& s = j["sessions"];
        cfg.sessions.max_idle_hours = s.value("max_idle_hours", cfg.sessions.max_idle_hours);
        cfg.sessions.sweep_interval_seconds = s.value("sweep_interval_seconds", cfg.sessions.sweep_interval_seconds);
        if (s.contains("engine")) {
            auto& e = s["engine"];
            cfg.sessions.engine.signal_interval_seconds =
                e.value("signal_interval_seconds", cfg.sessions.engine.signal_interval_seconds);
            cfg.sessions.engine.position_interval_seconds =
                e.value("position_interval_seconds", cfg.sessions.engine.position_interval_seconds);
            cfg.sessions.engine.error_backoff_seconds =
                e.value("error_backoff_seconds", cfg.sessions.engine.error_backoff_seconds);
        }
    }
    if (j.contains("logging")) {
        auto& l = j["logging"];
        cfg.logging.level = l.value("level", cfg.logging.level);
    }
    if (j.contains("auth")) {
        auto& a = j["auth"];
        cfg.auth.token = a.value("token", cfg.auth.token);
    }
}

inline void apply_logging(const LoggingConfig& cfg) {
    auto level = spdlog::level::from_str(cfg.level);
    // from_str maps unknown names to "off"; keep logging on in that case.
    if (level == spdlog::level::off && cfg.level != "off") {
        spdlog::warn("Unknown log level '{}', keeping info", cfg.level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
}

} // namespace trade_gate
