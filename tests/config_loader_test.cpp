#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "config/config_loader.hpp"
#include "config/job_definitions.hpp"
#include "scheduler/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

using namespace cronkit::config;
using cronkit::scheduler::InvalidArgumentError;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() {
        unsetenv(name_);
    }

private:
    const char* name_;
};

std::filesystem::path WriteTempFile(const std::string& file_name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / file_name;
    std::ofstream output(path);
    output << content;
    return path;
}

}  // namespace

TEST(ConfigLoaderTest, DefaultsWithoutFile) {
    const auto config = LoadConfig(std::filesystem::temp_directory_path() / "cronkit-missing-config.json");
    EXPECT_EQ(config.scheduler.worker_threads, 4);
    EXPECT_EQ(config.scheduler.max_worker_threads, 32);
    EXPECT_EQ(config.scheduler.log_level, "info");
    EXPECT_FALSE(config.http.enabled);
    EXPECT_EQ(config.http.port, 18790);
    EXPECT_TRUE(config.jobs_file.empty());
}

TEST(ConfigLoaderTest, AppliesJsonValues) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({
        "scheduler": {"workerThreads": 2, "maxWorkerThreads": 0, "logLevel": "debug"},
        "http": {"enabled": true, "host": "0.0.0.0", "port": 9000},
        "jobsFile": "/etc/cronkit/jobs.json"
    })"));
    EXPECT_EQ(config.scheduler.worker_threads, 2);
    EXPECT_EQ(config.scheduler.max_worker_threads, 0);
    EXPECT_EQ(config.scheduler.log_level, "debug");
    EXPECT_TRUE(config.http.enabled);
    EXPECT_EQ(config.http.host, "0.0.0.0");
    EXPECT_EQ(config.http.port, 9000);
    EXPECT_EQ(config.jobs_file, "/etc/cronkit/jobs.json");
}

TEST(ConfigLoaderTest, IgnoresWrongTypes) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({
        "scheduler": {"workerThreads": "many"},
        "http": {"port": "80"}
    })"));
    EXPECT_EQ(config.scheduler.worker_threads, 4);
    EXPECT_EQ(config.http.port, 18790);
}

TEST(ConfigLoaderTest, MalformedFileKeepsDefaults) {
    const auto path = WriteTempFile("cronkit-malformed-config.json", "{ not json");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.scheduler.worker_threads, 4);
    std::filesystem::remove(path);
}

TEST(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = WriteTempFile("cronkit-env-config.json", R"({"scheduler": {"workerThreads": 2}})");
    ScopedEnv threads("CRONKIT_SCHEDULER__WORKER_THREADS", "6");
    ScopedEnv level("CRONKIT_LOG_LEVEL", "warn");
    ScopedEnv port("CRONKIT_HTTP__PORT", "8088");

    const auto config = LoadConfig(path);
    EXPECT_EQ(config.scheduler.worker_threads, 6);
    EXPECT_EQ(config.scheduler.log_level, "warn");
    EXPECT_EQ(config.http.port, 8088);
    EXPECT_TRUE(config.http.enabled);
    std::filesystem::remove(path);
}

TEST(ConfigLoaderTest, NonIntegerEnvironmentValueIsIgnored) {
    ScopedEnv threads("CRONKIT_WORKER_THREADS", "lots");
    Config config{};
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.scheduler.worker_threads, 4);
}

TEST(ConfigLoaderTest, ParsesLogLevels) {
    using cronkit::utils::LogLevel;
    using cronkit::utils::ParseLogLevel;
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("loud", LogLevel::kWarn), LogLevel::kWarn);

    const auto previous = cronkit::utils::GetLogConfig();
    cronkit::utils::SetLogConfig({ParseLogLevel("error")});
    EXPECT_EQ(cronkit::utils::GetLogConfig().min_level, LogLevel::kError);
    cronkit::utils::SetLogConfig(previous);
}

TEST(JobDefinitionsTest, ParsesEntries) {
    const auto definitions = ParseJobDefinitions(nlohmann::json::parse(R"([
        {"message": "hourly report", "config": {"scheduler.name": "report", "scheduler.expression": "0 0 * * * *"}},
        {"message": "wake up", "at": "2026-10-20T08:00:00Z", "times": 3, "config": {"scheduler.period": 60}}
    ])"));
    ASSERT_EQ(definitions.size(), 2u);
    EXPECT_EQ(definitions[0].message, "hourly report");
    EXPECT_EQ(definitions[0].config["scheduler.name"], "report");
    EXPECT_FALSE(definitions[0].at.has_value());
    EXPECT_EQ(definitions[0].times, 1);

    ASSERT_TRUE(definitions[1].at.has_value());
    EXPECT_EQ(cronkit::utils::FormatIso(*definitions[1].at), "2026-10-20T08:00:00Z");
    EXPECT_EQ(definitions[1].times, 3);
}

TEST(JobDefinitionsTest, RejectsMalformedEntries) {
    EXPECT_THROW(ParseJobDefinitions(nlohmann::json::object()), InvalidArgumentError);
    EXPECT_THROW(ParseJobDefinitions(nlohmann::json::parse("[1]")), InvalidArgumentError);
    EXPECT_THROW(ParseJobDefinitions(nlohmann::json::parse(R"([{"message": 5}])")), InvalidArgumentError);
    EXPECT_THROW(ParseJobDefinitions(nlohmann::json::parse(R"([{"at": "tomorrow"}])")), InvalidArgumentError);
    EXPECT_THROW(ParseJobDefinitions(nlohmann::json::parse(R"([{"times": 2.5}])")), InvalidArgumentError);
    EXPECT_THROW(ParseJobDefinitions(nlohmann::json::parse(R"([{"config": {"nested": {"a": 1}}}])")),
                 InvalidArgumentError);
}

TEST(JobDefinitionsTest, MissingFileIsReported) {
    EXPECT_THROW(LoadJobDefinitions(std::filesystem::temp_directory_path() / "cronkit-no-such-jobs.json"),
                 InvalidArgumentError);
}
