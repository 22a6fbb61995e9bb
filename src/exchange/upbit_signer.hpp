#pragma once

#include <string>

namespace trade_gate {
namespace signing {

// Lower-case hex SHA-512 digest.
std::string sha512_hex(const std::string& data);

// Base64url without padding (RFC 7515 encoding for JWT segments).
std::string base64url(const std::string& data);

// Raw HMAC-SHA256 of `data` keyed by `secret`.
std::string hmac_sha256(const std::string& secret, const std::string& data);

/**
 * Build the HS256 token the exchange expects in the Authorization header.
 * Payload carries access_key and a fresh nonce; when `query` is non-empty it
 * also carries query_hash (SHA-512 of the unencoded query) and query_hash_alg.
 */
std::string make_token(const std::string& access_key,
                       const std::string& secret_key,
                       const std::string& query = {});

inline std::string bearer(const std::string& token) {
    return "Bearer " + token;
}

} // namespace signing
} // namespace trade_gate
