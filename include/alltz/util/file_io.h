#pragma once

#include <string>

namespace alltz {

// Reads entire file into a string. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Returns true if `path` names an existing regular file.
bool file_exists(const std::string& path);

// Default location of the configuration file:
//   $XDG_CONFIG_HOME/alltz/config.json, else $HOME/.config/alltz/config.json.
// Returns an empty string when neither variable is set.
std::string default_config_path();

} // namespace alltz
