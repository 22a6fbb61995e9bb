#include "login_service.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace trade_gate {

LoginService::LoginService(std::shared_ptr<SessionRegistry> registry, ClientFactory factory)
    : registry_(std::move(registry))
    , factory_(std::move(factory)) {
    if (!registry_ || !factory_) {
        throw std::invalid_argument("LoginService requires a registry and a client factory");
    }
}

LoginResult LoginService::login(int64_t user_id,
                                const std::string& username,
                                const std::string& access_key,
                                const std::string& secret_key) {
    if (access_key.empty() || secret_key.empty()) {
        throw std::invalid_argument("access_key and secret_key are required");
    }

    // Verification runs against a throwaway vault; no registry lock is held
    // while the call waits for admission.
    nlohmann::json accounts;
    {
        auto probe_vault = std::make_shared<CredentialVault>(access_key, secret_key);
        auto probe = factory_(probe_vault);
        accounts = probe->get_accounts();
        probe_vault->clear();
    }
    double balance = ExchangeClient::krw_balance(accounts);

    auto session = registry_->create_session(user_id, username);
    try {
        registry_->update_credentials(session, access_key, secret_key);
        registry_->set_client(session, TradingClientHandle(factory_(session->credentials())));
        registry_->update_login_status(session, true, nlohmann::json{
            {"balance", balance},
            {"accounts", accounts}
        });
    } catch (const SessionClosed&) {
        spdlog::warn("Login for {} (id={}) lost to a concurrent login", username, user_id);
        throw;
    }
    spdlog::info("Login verified for {} (balance {:.0f} KRW)", username, balance);
    return LoginResult{session, balance};
}

void LoginService::logout(int64_t user_id) {
    registry_->remove_session_async(user_id).get();
    spdlog::info("Logout complete for user_id={}", user_id);
}

} // namespace trade_gate
