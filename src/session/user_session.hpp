#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "credential_vault.hpp"
#include "trading_client_handle.hpp"
#include "trading_engine.hpp"
#include "../core/clock.hpp"
#include "../core/config.hpp"
#include "../core/rate_limiter.hpp"

namespace trade_gate {

/**
 * Raised when credentials, a client or login state are pushed into a session
 * that has already been torn down (for example, replaced by a newer login).
 */
class SessionClosed : public std::runtime_error {
public:
    explicit SessionClosed(const std::string& message)
        : std::runtime_error(message) {}
};

// Display / observability snapshot. Does not gate trading.
struct LoginSnapshot {
    bool logged_in{false};
    nlohmann::json account_info;     // null when logged out
    std::string login_time;          // ISO 8601, empty when logged out
};

/**
 * Isolated context of one authenticated user: credentials, exchange
 * connectivity, engine binding and login snapshot. Everything here is owned by
 * the session; other sessions never reach into it.
 */
class UserSession {
    struct CreateTag {
        explicit CreateTag() = default;
    };

public:
    static std::shared_ptr<UserSession> create(int64_t user_id,
                                               std::string username,
                                               std::shared_ptr<RateLimiter> limiter,
                                               EngineConfig engine_cfg = {},
                                               std::shared_ptr<Clock> clock = nullptr);
    // Only reachable through create(); the tag type is private.
    UserSession(CreateTag, int64_t user_id, std::string username, std::shared_ptr<Clock> clock);
    ~UserSession();

    UserSession(const UserSession&) = delete;
    UserSession& operator=(const UserSession&) = delete;

    int64_t user_id() const { return user_id_; }
    const std::string& username() const { return username_; }

    std::shared_ptr<CredentialVault> credentials() const { return vault_; }
    bool has_credentials() const { return !vault_->empty(); }

    // The three mutators below throw SessionClosed once teardown has begun.
    void update_credentials(std::string access_key, std::string secret_key);

    TradingClientHandle client_handle() const;
    void set_client(TradingClientHandle handle);

    const std::shared_ptr<TradingEngine>& engine() const { return engine_; }

    LoginSnapshot login_status() const;
    void update_login_status(bool logged_in, nlohmann::json account_info = nullptr);

    Timestamp created_at() const { return created_at_; }
    SteadyTime last_access() const;
    void touch();

    /**
     * Synchronous teardown: engine flagged to stop (loops exit on their next
     * iteration), client dropped, credentials scrubbed. Engine failures are
     * logged and never prevent the scrub.
     */
    void teardown();

    // Same as teardown() but waits for the engine loops to return before clearing.
    void teardown_and_wait();

    // True from the moment teardown begins; the session never comes back.
    bool torn_down() const;

    // Safe for APIs and logs: no secret material.
    nlohmann::json to_json() const;

private:
    void mark_closed();
    void clear_state();

    const int64_t user_id_;
    const std::string username_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<CredentialVault> vault_;
    std::shared_ptr<TradingEngine> engine_;
    Timestamp created_at_;

    mutable std::mutex mu_;
    TradingClientHandle client_;
    LoginSnapshot login_;
    SteadyTime last_access_;
    bool torn_down_{false};
};

} // namespace trade_gate
