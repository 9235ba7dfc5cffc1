#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace cronkit::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& CurrentConfig() {
    static LogConfig config;
    return config;
}

bool Enabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(LogMutex());
    return static_cast<int>(level) >= static_cast<int>(CurrentConfig().min_level);
}

void Write(LogLevel level, const std::string& tag, const std::string& line) {
    std::lock_guard<std::mutex> lock(LogMutex());
    std::cerr << "[" << tag << "] ";
    if (level == LogLevel::kWarn || level == LogLevel::kError) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << line << std::endl;
}

}  // namespace

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    CurrentConfig() = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return CurrentConfig();
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (!Enabled(level)) {
        return;
    }
    Write(level, tag, message);
}

void Log(const std::string& tag, const LogMessage& message) {
    if (!Enabled(message.level)) {
        return;
    }
    std::ostringstream line;
    line << message.message;
    const std::map<std::string, std::string> ordered(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : ordered) {
        line << " " << key << "=" << value;
    }
    Write(message.level, tag, line.str());
}

}  // namespace cronkit::utils
