#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace sandkeep::config {

// Defaults, then ~/.sandkeep/config.json, then environment overrides.
Config LoadConfig();

// Same layering with an explicit file; a missing file keeps the defaults.
Config LoadConfigFrom(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

// Flags are on unless set to "0" or "false" (any case).
bool ParseBool(const std::string& value);

}  // namespace sandkeep::config
