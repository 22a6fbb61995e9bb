#pragma once

#include <string>
#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>
#include "http_transport.hpp"

namespace trade_gate {

/**
 * HttpTransport backed by drogon::HttpClient.
 * The client runs on its own event loop thread so that the blocking send()
 * may be called from engine workers and from drogon handler threads alike.
 */
class DrogonTransport : public HttpTransport {
public:
    DrogonTransport(const std::string& base_url, double timeout_seconds);
    ~DrogonTransport() override;

    HttpResponse send(const HttpRequest& req) override;

private:
    trantor::EventLoopThread loop_thread_;
    drogon::HttpClientPtr client_;
    double timeout_seconds_;
};

} // namespace trade_gate
