#include <iostream>
#include <string>

#include "alltz/core/activity.h"

#define ALLTZ_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_activity() {
  using alltz::ActivityCategory;
  const alltz::TimeDisplayConfig cfg;

  ALLTZ_ASSERT(cfg.classify(14) == ActivityCategory::Work);
  ALLTZ_ASSERT(cfg.classify(7) == ActivityCategory::Awake);
  ALLTZ_ASSERT(cfg.classify(2) == ActivityCategory::Night);
  ALLTZ_ASSERT(cfg.glyph_for(cfg.classify(14)) == U'▓');
  ALLTZ_ASSERT(cfg.glyph_for(cfg.classify(7)) == U'▒');
  ALLTZ_ASSERT(cfg.glyph_for(cfg.classify(2)) == U'░');

  // Range ends are exclusive.
  ALLTZ_ASSERT(cfg.classify(9) == ActivityCategory::Work);
  ALLTZ_ASSERT(cfg.classify(17) == ActivityCategory::Awake);
  ALLTZ_ASSERT(cfg.classify(22) == ActivityCategory::Night);
  ALLTZ_ASSERT(cfg.classify(6) == ActivityCategory::Awake);
  ALLTZ_ASSERT(cfg.work_midpoint_hour() == 13);

  // Night shifts wrap past midnight; work wins over night where they overlap.
  {
    alltz::TimeDisplayConfig night_shift;
    night_shift.work_hours_start = 22;
    night_shift.work_hours_end = 6;
    night_shift.night_hours_start = 8;
    night_shift.night_hours_end = 16;
    ALLTZ_ASSERT(night_shift.classify(23) == ActivityCategory::Work);
    ALLTZ_ASSERT(night_shift.classify(3) == ActivityCategory::Work);
    ALLTZ_ASSERT(night_shift.classify(12) == ActivityCategory::Night);
    ALLTZ_ASSERT(night_shift.classify(18) == ActivityCategory::Awake);
  }

  // Colors depend on the theme, glyphs do not.
  ALLTZ_ASSERT(cfg.color_for(ActivityCategory::Work, alltz::ColorTheme::Default) == alltz::Color::Green);
  ALLTZ_ASSERT(cfg.color_for(ActivityCategory::Night, alltz::ColorTheme::Default) == alltz::Color::DarkGray);
  ALLTZ_ASSERT(cfg.color_for(ActivityCategory::Work, alltz::ColorTheme::Ocean) == alltz::Color::Cyan);

  ALLTZ_ASSERT(std::string(alltz::activity_category_name(ActivityCategory::Night)) == "night");

  return 0;
}
