#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace trade_gate {

enum class HttpMethod { GET, POST, DELETE };

inline const char* to_string(HttpMethod m) {
    switch (m) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::DELETE: return "DELETE";
    }
    return "GET";
}

struct HttpRequest {
    HttpMethod method{HttpMethod::GET};
    std::string path;
    std::vector<std::pair<std::string, std::string>> params;  // query string for GET/DELETE
    std::string body;                                         // JSON body for POST
    std::unordered_map<std::string, std::string> headers;
};

struct HttpResponse {
    int status{0};
    std::string body;
};

/**
 * Blocking HTTP seam between the exchange client and the network.
 * Implementations throw ExchangeError (status 0) when no response was received.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& req) = 0;
};

} // namespace trade_gate
