#pragma once

#include <stdexcept>
#include <string>

namespace trade_gate {

/**
 * Non-success answer (or transport failure, status 0) from the exchange.
 */
class ExchangeError : public std::runtime_error {
public:
    ExchangeError(int status, const std::string& message)
        : std::runtime_error("exchange error " + std::to_string(status) + ": " + message)
        , status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

/**
 * The exchange kept answering 429 after the secondary backoff ladder.
 */
class RateLimitExceeded : public ExchangeError {
public:
    explicit RateLimitExceeded(const std::string& message)
        : ExchangeError(429, message) {}
};

/**
 * A rate-limit wait was interrupted because the owning session is shutting down.
 */
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace trade_gate
