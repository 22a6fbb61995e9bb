#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "session_registry.hpp"
#include "../exchange/exchange_client.hpp"

namespace trade_gate {

// Builds an exchange client bound to the given vault.
using ClientFactory = std::function<std::shared_ptr<ExchangeClient>(std::shared_ptr<const CredentialVault>)>;

struct LoginResult {
    std::shared_ptr<UserSession> session;
    double krw_balance{0.0};
};

/**
 * Verify-then-create login flow. Credentials are checked against the exchange
 * (an admitted REST call) before any session exists; only a successful check
 * creates or replaces the user's session.
 */
class LoginService {
public:
    LoginService(std::shared_ptr<SessionRegistry> registry, ClientFactory factory);

    /**
     * Throws std::invalid_argument for empty keys and propagates ExchangeError
     * from the verification call. The registry is untouched on failure.
     * Throws SessionClosed when a concurrent login for the same user replaced
     * the new session before it was fully bound; that session is already scrubbed.
     */
    LoginResult login(int64_t user_id,
                      const std::string& username,
                      const std::string& access_key,
                      const std::string& secret_key);

    // Full teardown, waiting for the engine to unwind.
    void logout(int64_t user_id);

private:
    std::shared_ptr<SessionRegistry> registry_;
    ClientFactory factory_;
};

} // namespace trade_gate
