#pragma once

#include <string>
#include <unordered_map>

namespace cronkit::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

struct LogMessage {
    LogLevel level;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Accepts debug/info/warn/warning/error in any case; anything else yields fallback.
LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

// Writes "[tag] message" to stderr when level passes the configured minimum.
void Log(LogLevel level, const std::string& tag, const std::string& message);
// Same, with fields appended as " key=value" in key order.
void Log(const std::string& tag, const LogMessage& message);

}  // namespace cronkit::utils
