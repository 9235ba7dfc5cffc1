#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

#include "utils/logging.hpp"

namespace cronkit::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::Log(utils::LogLevel::kWarn, "config", "ignoring non-integer value '" + value + "'");
        return fallback;
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto configured = GetEnv("CRONKIT_CONFIG");
    if (!configured.empty()) {
        return configured;
    }
    return GetHomePath() / ".cronkit" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("scheduler") && data["scheduler"].is_object()) {
        const auto& scheduler = data["scheduler"];
        if (scheduler.contains("workerThreads") && scheduler["workerThreads"].is_number_integer()) {
            config.scheduler.worker_threads = scheduler["workerThreads"].get<int>();
        }
        if (scheduler.contains("maxWorkerThreads") && scheduler["maxWorkerThreads"].is_number_integer()) {
            config.scheduler.max_worker_threads = scheduler["maxWorkerThreads"].get<int>();
        }
        if (scheduler.contains("logLevel") && scheduler["logLevel"].is_string()) {
            config.scheduler.log_level = scheduler["logLevel"].get<std::string>();
        }
    }

    if (data.contains("http") && data["http"].is_object()) {
        const auto& http = data["http"];
        if (http.contains("enabled") && http["enabled"].is_boolean()) {
            config.http.enabled = http["enabled"].get<bool>();
        }
        if (http.contains("host") && http["host"].is_string()) {
            config.http.host = http["host"].get<std::string>();
        }
        if (http.contains("port") && http["port"].is_number_integer()) {
            config.http.port = http["port"].get<int>();
        }
    }

    if (data.contains("jobsFile") && data["jobsFile"].is_string()) {
        config.jobs_file = data["jobsFile"].get<std::string>();
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto worker_threads = GetEnvFallback(
        "CRONKIT_SCHEDULER__WORKER_THREADS",
        "CRONKIT_WORKER_THREADS");
    if (!worker_threads.empty()) {
        config.scheduler.worker_threads = ParseInt(worker_threads, config.scheduler.worker_threads);
    }

    const auto max_worker_threads = GetEnvFallback(
        "CRONKIT_SCHEDULER__MAX_WORKER_THREADS",
        "CRONKIT_MAX_WORKER_THREADS");
    if (!max_worker_threads.empty()) {
        config.scheduler.max_worker_threads = ParseInt(max_worker_threads, config.scheduler.max_worker_threads);
    }

    const auto log_level = GetEnvFallback(
        "CRONKIT_SCHEDULER__LOG_LEVEL",
        "CRONKIT_LOG_LEVEL");
    if (!log_level.empty()) {
        config.scheduler.log_level = log_level;
    }

    const auto http_enabled = GetEnv("CRONKIT_HTTP__ENABLED");
    if (!http_enabled.empty()) {
        config.http.enabled = ParseBool(http_enabled);
    }

    const auto http_host = GetEnv("CRONKIT_HTTP__HOST");
    if (!http_host.empty()) {
        config.http.host = http_host;
    }

    const auto http_port = GetEnv("CRONKIT_HTTP__PORT");
    if (!http_port.empty()) {
        config.http.port = ParseInt(http_port, config.http.port);
        config.http.enabled = true;
    }

    const auto jobs_file = GetEnv("CRONKIT_JOBS_FILE");
    if (!jobs_file.empty()) {
        config.jobs_file = jobs_file;
    }
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config",
                       "keeping defaults, failed to parse " + path.string() + ": " + ex.what());
        }
    }

    ApplyEnvOverrides(config);
    return config;
}

}  // namespace cronkit::config
