#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace stockade::config {

std::filesystem::path GetHomePath();

// ~/.stockade/config.json unless STOCKADE_CONFIG names another file.
std::filesystem::path GetConfigPath();

// Reads the config file (if present), then applies STOCKADE_* environment
// overrides and clamps numeric settings into their supported ranges.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

}  // namespace stockade::config
