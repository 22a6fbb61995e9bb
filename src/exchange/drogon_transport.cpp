#include "drogon_transport.hpp"
#include <spdlog/spdlog.h>
#include <drogon/HttpRequest.h>
#include "exchange_error.hpp"

namespace trade_gate {

DrogonTransport::DrogonTransport(const std::string& base_url, double timeout_seconds)
    : loop_thread_("exchange-http")
    , timeout_seconds_(timeout_seconds) {
    loop_thread_.run();
    client_ = drogon::HttpClient::newHttpClient(base_url, loop_thread_.getLoop());
    client_->setUserAgent("trade_gate/1.0");
    spdlog::info("Exchange transport ready: {}", base_url);
}

DrogonTransport::~DrogonTransport() {
    client_.reset();
    loop_thread_.getLoop()->quit();
    loop_thread_.wait();
}

HttpResponse DrogonTransport::send(const HttpRequest& req) {
    auto dreq = drogon::HttpRequest::newHttpRequest();
    switch (req.method) {
        case HttpMethod::GET: dreq->setMethod(drogon::Get); break;
        case HttpMethod::POST: dreq->setMethod(drogon::Post); break;
        case HttpMethod::DELETE: dreq->setMethod(drogon::Delete); break;
    }
    dreq->setPath(req.path);
    if (req.method == HttpMethod::POST) {
        dreq->setContentTypeCode(drogon::CT_APPLICATION_JSON);
        dreq->setBody(req.body);
    } else {
        for (const auto& kv : req.params) {
            dreq->setParameter(kv.first, kv.second);
        }
    }
    for (const auto& kv : req.headers) {
        if (kv.first == "Content-Type") continue;
        dreq->addHeader(kv.first, kv.second);
    }

    auto [result, resp] = client_->sendRequest(dreq, timeout_seconds_);
    if (result != drogon::ReqResult::Ok || !resp) {
        throw ExchangeError(0, "transport failure on " + req.path + " (code " +
                               std::to_string(static_cast<int>(result)) + ")");
    }
    return HttpResponse{static_cast<int>(resp->statusCode()), std::string(resp->body())};
}

} // namespace trade_gate
