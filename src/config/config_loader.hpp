#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace snipguard::config {

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);
std::filesystem::path DefaultConfigPath();

// Defaults, then the JSON file (missing file is fine), then environment overrides.
Config LoadConfig(const std::filesystem::path& path);
Config LoadConfig();

}  // namespace snipguard::config
