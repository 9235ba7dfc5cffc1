#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "scheduler/scheduler_types.hpp"

namespace cronkit::config {

// One entry of a jobs file:
//   {"message": "...", "config": {"scheduler.name": "...", "scheduler.expression": "..."},
//    "at": "2026-10-20T08:00:00Z", "times": 3}
struct JobDefinition {
    std::string message;
    scheduler::JobConfig config = scheduler::JobConfig::object();
    std::optional<scheduler::TimePoint> at;
    int times = 1;
};

// Throws scheduler::InvalidArgumentError on malformed entries.
std::vector<JobDefinition> ParseJobDefinitions(const nlohmann::json& data);
// Throws scheduler::InvalidArgumentError if the file can't be read or parsed.
std::vector<JobDefinition> LoadJobDefinitions(const std::filesystem::path& path);

}  // namespace cronkit::config
