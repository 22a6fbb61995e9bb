#include "exchange_client.hpp"
#include <spdlog/spdlog.h>
#include "upbit_signer.hpp"
#include "../core/utils.hpp"

namespace trade_gate {

ExchangeClient::ExchangeClient(std::shared_ptr<HttpTransport> transport,
                               std::shared_ptr<RateLimiter> limiter,
                               std::shared_ptr<const CredentialVault> credentials,
                               int max_throttle_retries)
    : transport_(std::move(transport))
    , limiter_(std::move(limiter))
    , credentials_(std::move(credentials))
    , max_throttle_retries_(max_throttle_retries) {}

nlohmann::json ExchangeClient::get_accounts() {
    HttpRequest req;
    req.path = "/v1/accounts";
    return perform(CallClass::REST, std::move(req), true);
}

nlohmann::json ExchangeClient::get_ticker(const std::vector<std::string>& markets) {
    std::string joined;
    for (const auto& m : markets) {
        if (!joined.empty()) joined += ',';
        joined += m;
    }
    HttpRequest req;
    req.path = "/v1/ticker";
    req.params = {{"markets", joined}};
    return perform(CallClass::REST, std::move(req), false);
}

nlohmann::json ExchangeClient::get_minute_candles(const std::string& market, int count) {
    HttpRequest req;
    req.path = "/v1/candles/minutes/1";
    req.params = {{"market", market}, {"count", std::to_string(count)}};
    return perform(CallClass::REST, std::move(req), false);
}

nlohmann::json ExchangeClient::get_order(const std::string& uuid) {
    HttpRequest req;
    req.path = "/v1/order";
    req.params = {{"uuid", uuid}};
    return perform(CallClass::REST, std::move(req), true);
}

nlohmann::json ExchangeClient::place_market_buy(const std::string& market, double krw_amount) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.path = "/v1/orders";
    req.params = {{"market", market}, {"side", "bid"}, {"ord_type", "price"},
                  {"price", utils::format_amount(krw_amount)}};
    return perform(CallClass::ORDER, std::move(req), true);
}

nlohmann::json ExchangeClient::place_market_sell(const std::string& market, double volume) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.path = "/v1/orders";
    req.params = {{"market", market}, {"side", "ask"}, {"ord_type", "market"},
                  {"volume", utils::format_amount(volume)}};
    return perform(CallClass::ORDER, std::move(req), true);
}

nlohmann::json ExchangeClient::cancel_order(const std::string& uuid) {
    HttpRequest req;
    req.method = HttpMethod::DELETE;
    req.path = "/v1/order";
    req.params = {{"uuid", uuid}};
    return perform(CallClass::ORDER, std::move(req), true);
}

double ExchangeClient::krw_balance(const nlohmann::json& accounts) {
    if (!accounts.is_array()) return 0.0;
    for (const auto& acc : accounts) {
        if (acc.value("currency", "") != "KRW") continue;
        const auto& bal = acc.contains("balance") ? acc["balance"] : nlohmann::json();
        if (bal.is_string()) return std::stod(bal.get<std::string>());
        if (bal.is_number()) return bal.get<double>();
        return 0.0;
    }
    return 0.0;
}

void ExchangeClient::sign_request(HttpRequest& req) const {
    if (!credentials_ || credentials_->empty()) {
        throw ExchangeError(401, "no credentials available for signed request");
    }
    auto token = signing::make_token(credentials_->access_key(),
                                     credentials_->secret_key(),
                                     utils::join_query(req.params));
    req.headers["Authorization"] = signing::bearer(token);
}

nlohmann::json ExchangeClient::perform(CallClass cls, HttpRequest req, bool sign) {
    if (req.method == HttpMethod::POST) {
        nlohmann::json body = nlohmann::json::object();
        for (const auto& kv : req.params) body[kv.first] = kv.second;
        req.body = body.dump();
        req.headers["Content-Type"] = "application/json";
    }

    for (int attempt = 0;; ++attempt) {
        if (stop_.stop_requested() || !limiter_->acquire(cls, &stop_)) {
            throw OperationCancelled(std::string("request cancelled: ") + req.path);
        }
        if (sign) sign_request(req);  // fresh nonce per attempt

        HttpResponse resp = transport_->send(req);

        if (resp.status == 429) {
            spdlog::warn("Exchange throttled {} {} (429, attempt {}): {}",
                         to_string(req.method), req.path, attempt + 1, resp.body);
            if (attempt >= max_throttle_retries_) {
                throw RateLimitExceeded(resp.body.empty() ? req.path : resp.body);
            }
            if (!limiter_->await_after_throttle(cls, &stop_) && stop_.stop_requested()) {
                throw OperationCancelled(std::string("request cancelled: ") + req.path);
            }
            continue;
        }
        if (resp.status < 200 || resp.status >= 300) {
            spdlog::error("Exchange call {} {} failed {}: {}",
                          to_string(req.method), req.path, resp.status, resp.body);
            throw ExchangeError(resp.status, resp.body);
        }
        if (resp.body.empty()) return nlohmann::json();
        try {
            return nlohmann::json::parse(resp.body);
        } catch (const nlohmann::json::parse_error& e) {
            throw ExchangeError(resp.status, std::string("malformed response: ") + e.what());
        }
    }
}

} // namespace trade_gate
