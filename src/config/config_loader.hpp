#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace cronkit::config {

// ~/.cronkit/config.json, or $CRONKIT_CONFIG when set.
std::filesystem::path DefaultConfigPath();

Config LoadConfig();
// Reads path when it exists (defaults are kept on parse errors), then applies
// CRONKIT_* environment overrides.
Config LoadConfig(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

}  // namespace cronkit::config
