#include <spdlog/spdlog.h>
#include <drogon/drogon.h>
#include <thread>
#include "core/config.hpp"
#include "core/rate_limiter.hpp"
#include "core/stop_token.hpp"
#include "exchange/drogon_transport.hpp"
#include "exchange/exchange_client.hpp"
#include "session/login_service.hpp"
#include "session/session_registry.hpp"
#include "control/control_server.hpp"

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    trade_gate::Config cfg;
    trade_gate::load_config(cfg, config_path);
    trade_gate::apply_logging(cfg.logging);
    spdlog::info("trade_gate starting. Control port={} bind={}",
                 cfg.services.control_port, cfg.services.bind_address);

    // The limiter models the exchange's per-account ceiling: one per process.
    auto limiter = std::make_shared<trade_gate::RateLimiter>(cfg.rate_limits);
    auto registry = std::make_shared<trade_gate::SessionRegistry>(limiter, cfg.sessions.engine);
    auto transport = std::make_shared<trade_gate::DrogonTransport>(cfg.exchange.base_url,
                                                                   cfg.exchange.timeout_seconds);
    int retries = cfg.exchange.max_throttle_retries;
    auto login_service = std::make_shared<trade_gate::LoginService>(
        registry,
        [transport, limiter, retries](std::shared_ptr<const trade_gate::CredentialVault> vault) {
            return std::make_shared<trade_gate::ExchangeClient>(transport, limiter, std::move(vault), retries);
        });

    trade_gate::StopToken sweeper_stop;
    auto max_idle = std::chrono::duration_cast<trade_gate::Duration>(
        std::chrono::duration<double, std::ratio<3600>>(cfg.sessions.max_idle_hours));
    std::thread sweeper([&] {
        auto interval = std::chrono::seconds(cfg.sessions.sweep_interval_seconds);
        while (!sweeper_stop.wait_for(interval)) {
            registry->evict_idle(max_idle);
        }
    });

    drogon::app().addListener(cfg.services.bind_address, cfg.services.control_port);
    drogon::app().setThreadNum(cfg.services.threads);
    drogon::app().registerController(
        std::make_shared<trade_gate::ControlServer>(registry, login_service, cfg));
    spdlog::info("Starting Drogon listener on {}:{}", cfg.services.bind_address, cfg.services.control_port);
    drogon::app().run();

    sweeper_stop.request_stop();
    sweeper.join();
    spdlog::info("trade_gate shutting down ({} active sessions)", registry->active_count());
    return 0;
}
