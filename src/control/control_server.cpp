#include "control_server.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "../exchange/exchange_error.hpp"

using json = nlohmann::json;

namespace trade_gate {

ControlServer::ControlServer(std::shared_ptr<SessionRegistry> registry,
                             std::shared_ptr<LoginService> login_service,
                             const Config& cfg)
    : registry_(std::move(registry))
    , login_service_(std::move(login_service))
    , cfg_(cfg)
    , workers_(std::make_unique<trantor::EventLoopThreadPool>(
          static_cast<size_t>(std::max(1, cfg.services.worker_threads)), "control-worker")) {
    workers_->start();
}

void ControlServer::offload(std::function<void()> task) {
    workers_->getNextLoop()->queueInLoop(std::move(task));
}

drogon::HttpResponsePtr ControlServer::unauthorized() {
    return json_resp(json{{"error", "unauthorized"}}, 401);
}

drogon::HttpResponsePtr ControlServer::json_resp(json body, int code) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(code));
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(body.dump());
    return resp;
}

bool ControlServer::authorize(const drogon::HttpRequestPtr& req) {
    if (cfg_.auth.token.empty()) return true;
    auto auth = req->getHeader("authorization");
    std::string expected = "Bearer " + cfg_.auth.token;
    return auth == expected;
}

void ControlServer::health(const drogon::HttpRequestPtr&,
                           std::function<void (const drogon::HttpResponsePtr &)> &&callback) {
    callback(json_resp(json{{"status", "healthy"}, {"active_sessions", registry_->active_count()}}));
}

void ControlServer::login(const drogon::HttpRequestPtr& req,
                          std::function<void (const drogon::HttpResponsePtr &)> &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    int64_t user_id = 0;
    std::string username, access_key, secret_key;
    try {
        auto body = json::parse(req->getBody());
        user_id = body.at("user_id").get<int64_t>();
        username = body.value("username", "user_" + std::to_string(user_id));
        access_key = body.value("access_key", "");
        secret_key = body.value("secret_key", "");
    } catch (const json::exception& e) {
        callback(json_resp(json{{"success", false}, {"error", std::string("bad request: ") + e.what()}}, 400));
        return;
    }

    offload([this, user_id, username, access_key, secret_key, callback = std::move(callback)] {
        try {
            auto result = login_service_->login(user_id, username, access_key, secret_key);
            callback(json_resp(json{
                {"success", true},
                {"username", username},
                {"account_info", {{"currency", "KRW"}, {"balance", result.krw_balance}}}
            }));
        } catch (const std::invalid_argument& e) {
            callback(json_resp(json{{"success", false}, {"error", e.what()}}, 400));
        } catch (const SessionClosed& e) {
            spdlog::warn("Login for user_id={} superseded by a concurrent login", user_id);
            callback(json_resp(json{{"success", false}, {"error", e.what()}}, 409));
        } catch (const ExchangeError& e) {
            spdlog::warn("Login verification failed for user_id={}: status {}", user_id, e.status());
            int code = (e.status() == 401 || e.status() == 429) ? e.status() : 502;
            callback(json_resp(json{{"success", false}, {"error", e.what()}}, code));
        } catch (const std::exception& e) {
            spdlog::error("Login failed for user_id={}: {}", user_id, e.what());
            callback(json_resp(json{{"success", false}, {"error", e.what()}}, 500));
        }
    });
}

void ControlServer::logout(const drogon::HttpRequestPtr& req,
                           std::function<void (const drogon::HttpResponsePtr &)> &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    int64_t user_id = 0;
    try {
        auto body = json::parse(req->getBody());
        user_id = body.at("user_id").get<int64_t>();
    } catch (const json::exception& e) {
        callback(json_resp(json{{"success", false}, {"error", std::string("bad request: ") + e.what()}}, 400));
        return;
    }

    offload([this, user_id, callback = std::move(callback)] {
        try {
            login_service_->logout(user_id);
            callback(json_resp(json{{"success", true}, {"user_id", user_id}}));
        } catch (const std::exception& e) {
            spdlog::error("Logout failed for user_id={}: {}", user_id, e.what());
            callback(json_resp(json{{"success", false}, {"error", e.what()}}, 500));
        }
    });
}

void ControlServer::listSessions(const drogon::HttpRequestPtr& req,
                                 std::function<void (const drogon::HttpResponsePtr &)> &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    json arr = json::array();
    for (auto& s : registry_->list_sessions()) {
        arr.push_back(s->to_json());
    }
    callback(json_resp(json{{"active_sessions", arr.size()}, {"sessions", arr}}));
}

void ControlServer::getSession(const drogon::HttpRequestPtr& req,
                               std::function<void (const drogon::HttpResponsePtr &)> &&callback,
                               int64_t user_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    auto session = registry_->get_session(user_id);
    if (!session) {
        callback(json_resp(json{{"error", "session not found, please log in again"}}, 404));
        return;
    }
    callback(json_resp(session->to_json()));
}

void ControlServer::rateLimit(const drogon::HttpRequestPtr& req,
                              std::function<void (const drogon::HttpResponsePtr &)> &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    callback(json_resp(registry_->limiter()->remaining_capacity().to_json()));
}

} // namespace trade_gate
