#pragma once

#include <functional>
#include <memory>
#include <string>
#include <drogon/HttpController.h>
#include <trantor/net/EventLoopThreadPool.h>
#include <nlohmann/json.hpp>
#include "../core/config.hpp"
#include "../session/login_service.hpp"
#include "../session/session_registry.hpp"

namespace trade_gate {

class ControlServer : public drogon::HttpController<ControlServer> {
public:
    static const bool isAutoCreation = false;
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(ControlServer::health, "/health", drogon::Get);
    ADD_METHOD_TO(ControlServer::login, "/api/login", drogon::Post);
    ADD_METHOD_TO(ControlServer::logout, "/api/logout", drogon::Post);
    ADD_METHOD_TO(ControlServer::listSessions, "/api/sessions", drogon::Get);
    ADD_METHOD_TO(ControlServer::getSession, "/api/sessions/{1}", drogon::Get);
    ADD_METHOD_TO(ControlServer::rateLimit, "/api/rate-limit", drogon::Get);
    METHOD_LIST_END

    ControlServer(std::shared_ptr<SessionRegistry> registry,
                  std::shared_ptr<LoginService> login_service,
                  const Config& cfg);

    void health(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback);
    void login(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback);
    void logout(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback);
    void listSessions(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback);
    void getSession(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback, int64_t user_id);
    void rateLimit(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback);

private:
    drogon::HttpResponsePtr unauthorized();
    drogon::HttpResponsePtr json_resp(nlohmann::json body, int code = 200);
    bool authorize(const drogon::HttpRequestPtr& req);
    // Runs work that may wait on the rate limiter or on engine shutdown.
    void offload(std::function<void()> task);

    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<LoginService> login_service_;
    Config cfg_;
    std::unique_ptr<trantor::EventLoopThreadPool> workers_;
};

} // namespace trade_gate
