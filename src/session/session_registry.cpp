#include "session_registry.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace trade_gate {

SessionRegistry::SessionRegistry(std::shared_ptr<RateLimiter> limiter,
                                 EngineConfig engine_cfg,
                                 std::shared_ptr<Clock> clock)
    : limiter_(std::move(limiter))
    , engine_cfg_(engine_cfg)
    , clock_(clock ? std::move(clock) : std::make_shared<SteadyClock>()) {
    if (!limiter_) {
        throw std::invalid_argument("SessionRegistry requires a rate limiter");
    }
}

SessionRegistry::~SessionRegistry() {
    std::unordered_map<int64_t, std::shared_ptr<UserSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& kv : sessions) {
        kv.second->teardown_and_wait();
    }
}

std::shared_ptr<UserSession> SessionRegistry::create_session(int64_t user_id, const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(user_id);
    if (it != sessions_.end()) {
        spdlog::info("Replacing existing session for {} (id={})", it->second->username(), user_id);
        it->second->teardown();
        sessions_.erase(it);
    }
    auto session = UserSession::create(user_id, username, limiter_, engine_cfg_, clock_);
    sessions_[user_id] = session;
    spdlog::info("Session registered for {} ({} active)", username, sessions_.size());
    return session;
}

std::shared_ptr<UserSession> SessionRegistry::get_session(int64_t user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(user_id);
    if (it == sessions_.end()) return nullptr;
    it->second->touch();
    return it->second;
}

void SessionRegistry::remove_session(int64_t user_id) {
    std::shared_ptr<UserSession> session;
    size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(user_id);
        if (it == sessions_.end()) {
            spdlog::warn("No session to remove for user_id={}", user_id);
            return;
        }
        session = it->second;
        session->teardown();
        sessions_.erase(it);
        remaining = sessions_.size();
    }
    spdlog::info("Session removed for {} ({} active)", session->username(), remaining);
}

std::future<void> SessionRegistry::remove_session_async(int64_t user_id) {
    std::shared_ptr<UserSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(user_id);
        if (it != sessions_.end()) {
            session = it->second;
            sessions_.erase(it);
            // Nothing may trade on behalf of this user from here on. The loop
            // threads stay with the engine so the teardown task can join them.
            session->engine()->signal_stop();
        }
    }
    if (!session) {
        spdlog::warn("No session to remove for user_id={}", user_id);
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }
    return std::async(std::launch::async, [session] {
        session->teardown_and_wait();
        spdlog::info("Session removed for {} after engine shutdown", session->username());
    });
}

void SessionRegistry::update_credentials(const std::shared_ptr<UserSession>& session,
                                         const std::string& access_key,
                                         const std::string& secret_key) {
    if (!session) return;
    session->update_credentials(access_key, secret_key);
}

void SessionRegistry::set_client(const std::shared_ptr<UserSession>& session, TradingClientHandle handle) {
    if (!session) return;
    session->set_client(std::move(handle));
}

void SessionRegistry::update_login_status(const std::shared_ptr<UserSession>& session,
                                          bool logged_in,
                                          nlohmann::json account_snapshot) {
    if (!session) return;
    session->update_login_status(logged_in, std::move(account_snapshot));
}

size_t SessionRegistry::evict_idle(Duration max_idle) {
    std::vector<std::shared_ptr<UserSession>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second->last_access() > max_idle) {
                it->second->teardown();
                expired.push_back(it->second);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& s : expired) {
        spdlog::info("Evicted idle session {} (id={})", s->username(), s->user_id());
    }
    if (!expired.empty()) {
        spdlog::info("Evicted {} idle sessions", expired.size());
    }
    return expired.size();
}

size_t SessionRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::shared_ptr<UserSession>> SessionRegistry::list_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<UserSession>> out;
    out.reserve(sessions_.size());
    for (auto& kv : sessions_) out.push_back(kv.second);
    return out;
}

} // namespace trade_gate
