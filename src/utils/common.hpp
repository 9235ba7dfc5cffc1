#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace cronkit::utils {

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

// UTC, second resolution: 2026-10-19T08:30:00Z
inline std::string FormatIso(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Parses YYYY-MM-DDTHH:MM:SS with an optional trailing 'Z', interpreted as UTC.
inline std::optional<std::chrono::system_clock::time_point> ParseIso(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    std::tm tm{};
    std::istringstream ss(value);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    std::string rest;
    ss >> rest;
    if (!rest.empty() && rest != "Z") {
        return std::nullopt;
    }
    const std::time_t seconds = timegm(&tm);
    if (seconds < 0) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

}  // namespace cronkit::utils
