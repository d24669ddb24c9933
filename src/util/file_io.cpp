#include "alltz/util/file_io.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace alltz {

std::string read_text_file(const std::string& path) {
  std::ifstream in(std::filesystem::path(path), std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("Failed to read file: " + path);
  return ss.str();
}

bool file_exists(const std::string& path) {
  if (path.empty()) return false;
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && !ec;
}

std::string default_config_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return (std::filesystem::path(xdg) / "alltz" / "config.json").string();
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return (std::filesystem::path(home) / ".config" / "alltz" / "config.json").string();
  }
  return {};
}

} // namespace alltz
