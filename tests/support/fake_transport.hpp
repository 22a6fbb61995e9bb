#pragma once

#include <deque>
#include <mutex>
#include <vector>
#include "../../src/exchange/http_transport.hpp"

namespace trade_gate {
namespace testing {

/**
 * Scripted transport: answers queued responses in order, then repeats the
 * fallback. Every request is captured for inspection.
 */
class FakeTransport : public HttpTransport {
public:
    explicit FakeTransport(HttpResponse fallback = {200, "{}"})
        : fallback_(std::move(fallback)) {}

    HttpResponse send(const HttpRequest& req) override {
        std::lock_guard<std::mutex> lock(mu_);
        requests_.push_back(req);
        if (script_.empty()) return fallback_;
        auto resp = script_.front();
        script_.pop_front();
        return resp;
    }

    void enqueue(int status, std::string body) {
        std::lock_guard<std::mutex> lock(mu_);
        script_.push_back(HttpResponse{status, std::move(body)});
    }

    void set_fallback(int status, std::string body) {
        std::lock_guard<std::mutex> lock(mu_);
        fallback_ = HttpResponse{status, std::move(body)};
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mu_);
        return requests_;
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mu_);
        return requests_.size();
    }

private:
    mutable std::mutex mu_;
    HttpResponse fallback_;
    std::deque<HttpResponse> script_;
    std::vector<HttpRequest> requests_;
};

inline const char* kAccountsBody =
    R"([{"currency":"KRW","balance":"150000.5","locked":"0"},)"
    R"({"currency":"BTC","balance":"0.01","locked":"0"}])";

} // namespace testing
} // namespace trade_gate
