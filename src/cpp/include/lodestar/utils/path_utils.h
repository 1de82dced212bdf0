#pragma once

#include <string>

namespace lodestar {
namespace utils {

// $XDG_CONFIG_HOME/lodestar, ~/.config/lodestar, or %APPDATA%\lodestar
std::string get_config_dir();

// Default location of the persisted server list
std::string get_default_store_path();

// Random RFC 4122 version 4 UUID, lowercase
std::string generate_uuid();

} // namespace utils
} // namespace lodestar
