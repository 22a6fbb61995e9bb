#include "credential_vault.hpp"
#include <utility>
#include <openssl/crypto.h>

namespace trade_gate {

CredentialVault::CredentialVault(std::string access_key, std::string secret_key) {
    store(std::move(access_key), std::move(secret_key));
}

CredentialVault::~CredentialVault() {
    clear();
}

void CredentialVault::store(std::string access_key, std::string secret_key) {
    std::lock_guard<std::mutex> lock(mu_);
    wipe(access_key_);
    wipe(secret_key_);
    access_key_ = std::move(access_key);
    secret_key_ = std::move(secret_key);
}

void CredentialVault::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    wipe(access_key_);
    wipe(secret_key_);
}

bool CredentialVault::empty() const {
    std::lock_guard<std::mutex> lock(mu_);
    return access_key_.empty() || secret_key_.empty();
}

std::string CredentialVault::access_key() const {
    std::lock_guard<std::mutex> lock(mu_);
    return access_key_;
}

std::string CredentialVault::secret_key() const {
    std::lock_guard<std::mutex> lock(mu_);
    return secret_key_;
}

std::string CredentialVault::masked_access_key() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (access_key_.empty()) return "<none>";
    return access_key_.substr(0, 4) + "****";
}

void CredentialVault::wipe(std::string& s) {
    if (!s.empty()) {
        OPENSSL_cleanse(&s[0], s.size());
    }
    s.clear();
    s.shrink_to_fit();
}

} // namespace trade_gate
