#pragma once

#include <memory>
#include "../exchange/exchange_client.hpp"

namespace trade_gate {

/**
 * Opaque per-session connectivity handle. Empty until the session is bound to
 * a verified exchange client; reset during teardown.
 */
class TradingClientHandle {
public:
    TradingClientHandle() = default;
    explicit TradingClientHandle(std::shared_ptr<ExchangeClient> client)
        : client_(std::move(client)) {}

    bool valid() const { return static_cast<bool>(client_); }
    explicit operator bool() const { return valid(); }

    const std::shared_ptr<ExchangeClient>& client() const { return client_; }

    // Cancel pending admission waits and drop the client.
    void reset() {
        if (client_) client_->cancel();
        client_.reset();
    }

private:
    std::shared_ptr<ExchangeClient> client_;
};

} // namespace trade_gate
