#pragma once

#include <memory>
#include <string>
#include <vector>

#include "alltz/core/time_zone.h"

namespace alltz {

struct ZoneCatalogEntry {
  std::string id;
  std::string posix_rule;
  // Optional display label overriding the one derived from the id.
  std::string label;
};

// Maps zone identifiers to POSIX rules.
//
// The built-in table covers commonly used IANA zones with their current rules;
// configuration files can register more (or override built-in ones).
class ZoneCatalog {
 public:
  static ZoneCatalog with_builtin_zones();

  // Adds or replaces an entry. Throws std::runtime_error if the rule does not parse.
  void add(ZoneCatalogEntry entry);

  // Case-insensitive lookup; nullptr if absent.
  const ZoneCatalogEntry* find(const std::string& id) const;

  // Entries sorted by id.
  std::vector<ZoneCatalogEntry> entries() const;

  // Resolve `id` to a time zone, trying in order:
  //  - a catalog entry,
  //  - "UTC", "GMT", "UTC+H[:MM]", "UTC-H[:MM]" fixed offsets,
  //  - `id` itself as a POSIX TZ rule.
  // Throws std::runtime_error for unknown identifiers.
  std::unique_ptr<TimeZone> load(const std::string& id, const std::string& label = "") const;

 private:
  std::vector<ZoneCatalogEntry> entries_;
};

} // namespace alltz
