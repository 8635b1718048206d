#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <random>
#include <cctype>

namespace tradekit {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Shared string/time helpers used by the loader, the task manager and the
 * control server.
 */
namespace utils {

/**
 * Strip leading and trailing whitespace.
 */
inline std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

/**
 * Split on a single delimiter, keeping empty fields.
 */
inline std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string field;
    std::istringstream ss(s);
    while (std::getline(ss, field, delim)) {
        out.push_back(field);
    }
    // getline drops a trailing empty field
    if (!s.empty() && s.back() == delim) out.emplace_back();
    return out;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

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
 * Generate a 32 character hex task id.
 */
inline std::string generate_id() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(16) << dist(gen);
    ss << std::setw(16) << dist(gen);
    return ss.str();
}

} // namespace utils
} // namespace tradekit
