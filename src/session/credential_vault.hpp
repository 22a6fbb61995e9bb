#pragma once

#include <mutex>
#include <string>

namespace trade_gate {

/**
 * In-memory holder for one user's exchange key pair.
 * Never persisted, never serialized; clear() scrubs the bytes before release.
 */
class CredentialVault {
public:
    CredentialVault() = default;
    CredentialVault(std::string access_key, std::string secret_key);
    ~CredentialVault();

    CredentialVault(const CredentialVault&) = delete;
    CredentialVault& operator=(const CredentialVault&) = delete;

    void store(std::string access_key, std::string secret_key);
    void clear();

    bool empty() const;
    std::string access_key() const;
    std::string secret_key() const;

    // First four characters of the access key followed by a mask; safe for logs.
    std::string masked_access_key() const;

private:
    static void wipe(std::string& s);

    mutable std::mutex mu_;
    std::string access_key_;
    std::string secret_key_;
};

} // namespace trade_gate
