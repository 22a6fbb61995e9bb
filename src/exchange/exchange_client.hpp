#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "http_transport.hpp"
#include "exchange_error.hpp"
#include "../core/rate_limiter.hpp"
#include "../core/stop_token.hpp"
#include "../session/credential_vault.hpp"

namespace trade_gate {

/**
 * Upbit REST client bound to one credential vault.
 *
 * Every call is admitted by the shared RateLimiter under its call class before
 * the request leaves the process. A 429 answer triggers the limiter's
 * secondary backoff and a bounded number of retries; persistent throttling
 * surfaces as RateLimitExceeded.
 */
class ExchangeClient {
public:
    ExchangeClient(std::shared_ptr<HttpTransport> transport,
                   std::shared_ptr<RateLimiter> limiter,
                   std::shared_ptr<const CredentialVault> credentials,
                   int max_throttle_retries = 3);

    // REST class
    nlohmann::json get_accounts();
    nlohmann::json get_ticker(const std::vector<std::string>& markets);
    nlohmann::json get_minute_candles(const std::string& market, int count = 20);
    nlohmann::json get_order(const std::string& uuid);

    // ORDER class
    nlohmann::json place_market_buy(const std::string& market, double krw_amount);
    nlohmann::json place_market_sell(const std::string& market, double volume);
    nlohmann::json cancel_order(const std::string& uuid);

    // Abort pending admission waits; later calls throw OperationCancelled.
    void cancel() { stop_.request_stop(); }
    bool cancelled() const { return stop_.stop_requested(); }

    // KRW balance from a get_accounts() answer; 0 when absent.
    static double krw_balance(const nlohmann::json& accounts);

private:
    nlohmann::json perform(CallClass cls, HttpRequest req, bool sign);
    void sign_request(HttpRequest& req) const;

    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<RateLimiter> limiter_;
    std::shared_ptr<const CredentialVault> credentials_;
    int max_throttle_retries_;
    StopToken stop_;
};

} // namespace trade_gate
