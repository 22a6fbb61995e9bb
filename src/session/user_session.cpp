#include "user_session.hpp"
#include <spdlog/spdlog.h>
#include "../core/utils.hpp"

namespace trade_gate {

std::shared_ptr<UserSession> UserSession::create(int64_t user_id,
                                                 std::string username,
                                                 std::shared_ptr<RateLimiter> limiter,
                                                 EngineConfig engine_cfg,
                                                 std::shared_ptr<Clock> clock) {
    auto session = std::make_shared<UserSession>(CreateTag{}, user_id, std::move(username), std::move(clock));
    // The engine reaches its session only through this weak handle.
    session->engine_ = std::make_shared<TradingEngine>(user_id, session, std::move(limiter), engine_cfg);
    spdlog::info("Session created: {} (id={})", session->username_, user_id);
    return session;
}

UserSession::UserSession(CreateTag, int64_t user_id, std::string username, std::shared_ptr<Clock> clock)
    : user_id_(user_id)
    , username_(std::move(username))
    , clock_(clock ? std::move(clock) : std::make_shared<SteadyClock>())
    , vault_(std::make_shared<CredentialVault>())
    , created_at_(std::chrono::system_clock::now())
    , last_access_(clock_->now()) {}

UserSession::~UserSession() {
    if (engine_) {
        try {
            engine_->request_stop();
        } catch (const std::exception& e) {
            spdlog::error("Engine stop failed while destroying session {}: {}", username_, e.what());
        }
    }
    vault_->clear();
}

void UserSession::update_credentials(std::string access_key, std::string secret_key) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (torn_down_) {
            throw SessionClosed("session for " + username_ + " is closed, credentials rejected");
        }
        // Stored under mu_ so a concurrent teardown always scrubs after us.
        vault_->store(std::move(access_key), std::move(secret_key));
        last_access_ = clock_->now();
    }
    spdlog::info("Credentials updated for {} (key {})", username_, vault_->masked_access_key());
}

TradingClientHandle UserSession::client_handle() const {
    std::lock_guard<std::mutex> lock(mu_);
    return client_;
}

void UserSession::set_client(TradingClientHandle handle) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (torn_down_) {
            handle.reset();
            throw SessionClosed("session for " + username_ + " is closed, client rejected");
        }
        client_ = std::move(handle);
        last_access_ = clock_->now();
    }
    spdlog::info("Exchange client attached for {}", username_);
}

LoginSnapshot UserSession::login_status() const {
    std::lock_guard<std::mutex> lock(mu_);
    return login_;
}

void UserSession::update_login_status(bool logged_in, nlohmann::json account_info) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (torn_down_) {
            throw SessionClosed("session for " + username_ + " is closed, login status rejected");
        }
        login_.logged_in = logged_in;
        login_.account_info = std::move(account_info);
        login_.login_time = logged_in ? utils::ts_to_iso(std::chrono::system_clock::now()) : "";
        last_access_ = clock_->now();
    }
    spdlog::info("Login status for {} -> {}", username_, logged_in);
}

SteadyTime UserSession::last_access() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_access_;
}

void UserSession::touch() {
    std::lock_guard<std::mutex> lock(mu_);
    last_access_ = clock_->now();
}

bool UserSession::torn_down() const {
    std::lock_guard<std::mutex> lock(mu_);
    return torn_down_;
}

void UserSession::mark_closed() {
    std::lock_guard<std::mutex> lock(mu_);
    torn_down_ = true;
}

void UserSession::teardown() {
    spdlog::info("Tearing down session {}", username_);
    mark_closed();
    try {
        engine_->request_stop();
    } catch (const std::exception& e) {
        spdlog::error("Engine stop failed for {}: {}", username_, e.what());
    }
    clear_state();
}

void UserSession::teardown_and_wait() {
    spdlog::info("Tearing down session {} (waiting for engine)", username_);
    mark_closed();
    try {
        engine_->signal_stop();
        // Interrupt admission waits so the loops can unwind before the join.
        auto handle = client_handle();
        if (handle) handle.client()->cancel();
        engine_->stop();
    } catch (const std::exception& e) {
        spdlog::error("Engine shutdown failed for {}: {}", username_, e.what());
    }
    clear_state();
}

void UserSession::clear_state() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        client_.reset();
        login_ = LoginSnapshot{};
        torn_down_ = true;
    }
    vault_->clear();
    spdlog::info("Session {} cleared", username_);
}

nlohmann::json UserSession::to_json() const {
    auto login = login_status();
    nlohmann::json out{
        {"user_id", user_id_},
        {"username", username_},
        {"created_at", utils::ts_to_iso(created_at_)},
        {"has_credentials", has_credentials()},
        {"client_attached", client_handle().valid()},
        {"logged_in", login.logged_in},
        {"login_time", login.login_time},
        {"account_info", login.account_info},
        {"engine", engine_->status()}
    };
    return out;
}

} // namespace trade_gate
