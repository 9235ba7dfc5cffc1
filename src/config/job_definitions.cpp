#include "config/job_definitions.hpp"

#include <fstream>

#include "scheduler/errors.hpp"
#include "scheduler/job.hpp"
#include "utils/common.hpp"

namespace cronkit::config {

std::vector<JobDefinition> ParseJobDefinitions(const nlohmann::json& data) {
    if (!data.is_array()) {
        throw scheduler::InvalidArgumentError("jobs file must contain a JSON array");
    }
    std::vector<JobDefinition> definitions;
    definitions.reserve(data.size());
    std::size_t index = 0;
    for (const auto& item : data) {
        const auto where = "job #" + std::to_string(index++);
        if (!item.is_object()) {
            throw scheduler::InvalidArgumentError(where + " is not an object");
        }
        JobDefinition definition;
        if (item.contains("message")) {
            if (!item["message"].is_string()) {
                throw scheduler::InvalidArgumentError(where + ": 'message' must be a string");
            }
            definition.message = item["message"].get<std::string>();
        }
        if (item.contains("config")) {
            scheduler::ValidateConfig(item["config"]);
            if (item["config"].is_object()) {
                definition.config = item["config"];
            }
        }
        if (item.contains("at")) {
            const auto at = item["at"].is_string()
                                ? utils::ParseIso(item["at"].get<std::string>())
                                : std::nullopt;
            if (!at.has_value()) {
                throw scheduler::InvalidArgumentError(where + ": 'at' must be YYYY-MM-DDTHH:MM:SSZ");
            }
            definition.at = at;
        }
        if (item.contains("times")) {
            if (!item["times"].is_number_integer()) {
                throw scheduler::InvalidArgumentError(where + ": 'times' must be an integer");
            }
            definition.times = item["times"].get<int>();
        }
        definitions.push_back(std::move(definition));
    }
    return definitions;
}

std::vector<JobDefinition> LoadJobDefinitions(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw scheduler::InvalidArgumentError("cannot open jobs file " + path.string());
    }
    nlohmann::json data;
    try {
        input >> data;
    } catch (const nlohmann::json::exception& ex) {
        throw scheduler::InvalidArgumentError("cannot parse jobs file " + path.string() + ": " + ex.what());
    }
    return ParseJobDefinitions(data);
}

}  // namespace cronkit::config
