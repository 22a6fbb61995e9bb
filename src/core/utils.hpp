#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace trade_gate {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Shared utility functions.
 */
namespace utils {

/**
 * Format timestamp as ISO 8601 string (e.g., "2024-01-15T10:30:00Z").
 */
inline std::string ts_to_iso(Timestamp ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

/**
 * Generate a UUID-like ID (v4 layout). Used for request nonces.
 */
inline std::string generate_id() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (dist(gen) & 0xFFFFFFFF) << "-";
    ss << std::setw(4) << (dist(gen) & 0xFFFF) << "-";
    ss << std::setw(4) << ((dist(gen) & 0x0FFF) | 0x4000) << "-";
    ss << std::setw(4) << ((dist(gen) & 0x3FFF) | 0x8000) << "-";
    ss << std::setw(12) << (dist(gen) & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

/**
 * Join key/value pairs as "k1=v1&k2=v2" without percent-encoding; this is the
 * form the exchange hashes for signed requests.
 */
inline std::string join_query(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string out;
    for (const auto& kv : params) {
        if (!out.empty()) out += '&';
        out += kv.first;
        out += '=';
        out += kv.second;
    }
    return out;
}

/**
 * Format an amount without trailing zeros (e.g., 5000 -> "5000", 0.015 -> "0.015").
 */
inline std::string format_amount(double v) {
    std::ostringstream ss;
    ss << std::setprecision(15) << v;
    return ss.str();
}

} // namespace utils
} // namespace trade_gate
