#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <algorithm>

namespace utils {

// Current time in milliseconds since epoch
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    }
    static const char* const units[] = {"KB", "MB", "GB", "TB"};
    double v = (double)bytes / 1024.0;
    int u = 0;
    while (v >= 1024.0 && u < 3) {
        v /= 1024.0;
        ++u;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v << " " << units[u];
    return ss.str();
}

// Format speed as "X.XX MB/s"
inline std::string format_speed(double bytes_per_sec) {
    if (bytes_per_sec < 1024.0) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << bytes_per_sec << " B/s";
        return ss.str();
    }
    return format_bytes((u64)bytes_per_sec) + "/s";
}

// Format duration as "1h 23m 45s" or "45s"
inline std::string format_duration_s(u64 seconds) {
    if (seconds < 60) return std::to_string(seconds) + "s";
    if (seconds < 3600) {
        return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
    }
    return std::to_string(seconds / 3600) + "h " +
           std::to_string((seconds % 3600) / 60) + "m " +
           std::to_string(seconds % 60) + "s";
}

// done/total*100 rounded to two decimals (0 when total is 0)
inline double percent(u64 done, u64 total) {
    if (total == 0) return 0.0;
    double pct = (double)done / (double)total * 100.0;
    return (double)(i64)(pct * 100.0 + 0.5) / 100.0;
}

// Progress percentage string, e.g. "48.83%"
inline std::string format_percent(u64 done, u64 total) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << percent(done, total) << "%";
    return ss.str();
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

// Clamp value
template<typename T>
inline T clamp(T val, T lo, T hi) {
    return val < lo ? lo : (val > hi ? hi : val);
}

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }
    return s;
}

// "~" and "~/x" -> home-relative; other paths unchanged
inline std::string expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() == 1) return platform::home_dir();
    if (path[1] == '/') return platform::home_dir() + path.substr(1);
    return path;
}

// Strict unsigned parse; throws std::invalid_argument on junk or on a
// value that does not fit in 64 bits
inline u64 parse_u64(const std::string& s) {
    std::string t = trim(s);
    if (t.empty() || !std::all_of(t.begin(), t.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw std::invalid_argument("not an unsigned integer: '" + s + "'");
    }
    try {
        return (u64)std::stoull(t);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("integer out of range: '" + s + "'");
    }
}

// "yes"/"true"/"1"/"on" and their negatives
inline bool parse_bool(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "yes" || v == "true" || v == "1" || v == "on")  return true;
    if (v == "no"  || v == "false" || v == "0" || v == "off") return false;
    throw std::invalid_argument("not a boolean: '" + s + "'");
}

} // namespace utils
