#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "user_session.hpp"
#include "../core/clock.hpp"
#include "../core/config.hpp"
#include "../core/rate_limiter.hpp"

namespace trade_gate {

/**
 * Owns every live UserSession, keyed by user id. At most one session exists
 * per user id; replacing or removing one always tears it down first.
 */
class SessionRegistry {
public:
    explicit SessionRegistry(std::shared_ptr<RateLimiter> limiter,
                             EngineConfig engine_cfg = {},
                             std::shared_ptr<Clock> clock = nullptr);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    std::shared_ptr<UserSession> create_session(int64_t user_id, const std::string& username);

    // nullptr when absent; the caller should re-authenticate. Touches last_access on hit.
    std::shared_ptr<UserSession> get_session(int64_t user_id);

    // Unknown ids are a no-op.
    void remove_session(int64_t user_id);

    /**
     * Removes the entry and flags the engine immediately, then waits for the
     * engine loops to unwind on a background task before clearing secrets.
     * The returned future is ready once the session is fully torn down.
     */
    std::future<void> remove_session_async(int64_t user_id);

    void update_credentials(const std::shared_ptr<UserSession>& session,
                            const std::string& access_key,
                            const std::string& secret_key);
    void set_client(const std::shared_ptr<UserSession>& session, TradingClientHandle handle);
    void update_login_status(const std::shared_ptr<UserSession>& session,
                             bool logged_in,
                             nlohmann::json account_snapshot = nullptr);

    // Sync-teardown every session idle longer than `max_idle`; returns how many went.
    size_t evict_idle(Duration max_idle);

    size_t active_count() const;
    std::vector<std::shared_ptr<UserSession>> list_sessions() const;

    const std::shared_ptr<RateLimiter>& limiter() const { return limiter_; }

private:
    std::shared_ptr<RateLimiter> limiter_;
    EngineConfig engine_cfg_;
    std::shared_ptr<Clock> clock_;

    std::unordered_map<int64_t, std::shared_ptr<UserSession>> sessions_;
    mutable std::mutex mutex_;
};

} // namespace trade_gate
