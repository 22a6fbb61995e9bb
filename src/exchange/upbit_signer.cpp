#include "upbit_signer.hpp"
#include <iomanip>
#include <sstream>
#include <vector>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include "../core/utils.hpp"

namespace trade_gate {
namespace signing {

std::string sha512_hex(const std::string& data) {
    unsigned char digest[SHA512_DIGEST_LENGTH];
    SHA512(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

    std::ostringstream out;
    for (unsigned char c : digest) {
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
    return out.str();
}

std::string base64url(const std::string& data) {
    std::vector<unsigned char> buf(4 * ((data.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(buf.data(),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    std::string out(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(len));
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!out.empty() && out.back() == '=') out.pop_back();
    return out;
}

std::string hmac_sha256(const std::string& secret, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    HMAC(EVP_sha256(),
         secret.data(), static_cast<int>(secret.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         digest, &digest_len);
    return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string make_token(const std::string& access_key,
                       const std::string& secret_key,
                       const std::string& query) {
    nlohmann::json header{{"alg", "HS256"}, {"typ", "JWT"}};
    nlohmann::json payload{
        {"access_key", access_key},
        {"nonce", utils::generate_id()}
    };
    if (!query.empty()) {
        payload["query_hash"] = sha512_hex(query);
        payload["query_hash_alg"] = "SHA512";
    }
    std::string signing_input = base64url(header.dump()) + "." + base64url(payload.dump());
    return signing_input + "." + base64url(hmac_sha256(secret_key, signing_input));
}

} // namespace signing
} // namespace trade_gate
