#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "config/config_schema.hpp"

namespace replbox::config {

std::filesystem::path GetConfigPath();

// ~/.replbox/config.json followed by REPLBOX_* environment overrides.
Config LoadConfig();
Config LoadConfigFrom(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvironmentOverrides(Config& config);

}  // namespace replbox::config
