#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"

namespace healbox::config {

Config LoadConfig();
Config LoadConfigFrom(const std::filesystem::path& path);

// Expands a leading "~/" against $HOME.
std::string ExpandHome(const std::string& path);

}  // namespace healbox::config
