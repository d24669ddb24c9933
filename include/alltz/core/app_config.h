#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "alltz/core/activity.h"
#include "alltz/core/color_theme.h"
#include "alltz/core/display_options.h"
#include "alltz/core/zone_catalog.h"
#include "alltz/util/json.h"

namespace alltz {

// Limits on the rendered grid.
inline constexpr int kMinWidth = 4;
inline constexpr int kMaxWidth = 1000;
inline constexpr int kMinZoneHeight = 3;
inline constexpr int kMaxZoneHeight = 100;
inline constexpr int kMaxGridRows = 10000;

struct ZoneSelection {
  std::string id;
  // Empty: derive the label from the zone id.
  std::string label;
};

// User settings, loaded from JSON and overridden by command-line flags.
struct AppConfig {
  TimeFormat time_format{TimeFormat::TwentyFourHour};
  ZoneDisplayMode zone_display{ZoneDisplayMode::Short};
  ColorTheme theme{ColorTheme::Default};
  bool show_date{true};
  bool show_dst{true};

  // Total timeline width in cells, border included.
  int width{80};

  TimeDisplayConfig hours;

  std::vector<ZoneSelection> zones{{"UTC", ""}};

  // Extra POSIX-rule zones registered on top of the built-in catalog.
  std::vector<ZoneCatalogEntry> custom_zones;

  // Non-fatal problems found while loading (already logged).
  std::vector<std::string> warnings;
};

// Applies the keys present in `root` on top of the defaults.
// Throws std::runtime_error on wrong types and unknown enum strings.
AppConfig app_config_from_json(const json::Value& root);

// read_text_file + json::parse + app_config_from_json. Errors name the file.
AppConfig load_app_config(const std::string& path);

// Checks a grid of `zone_count` timelines, each `width` x `height` cells,
// against the limits above. Returns an empty string when it fits, else the
// problem.
std::string check_grid_size(int width, int height, std::size_t zone_count);

// Built-in catalog plus the configuration's custom zones.
ZoneCatalog build_zone_catalog(const AppConfig& cfg);

} // namespace alltz
