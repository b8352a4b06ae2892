#pragma once

#include <cstddef>
#include <set>
#include <string>

#include "internal/util/time.hpp"

namespace waterfall::runtime::config {
class CalendarConfig;
}

namespace waterfall::calendar {

/*
  Dates excluded from working-day status for one region.

  Loaded once per run and never mutated afterwards.
*/
class HolidayCalendar {
 public:
  HolidayCalendar() = default;
  HolidayCalendar(std::string region, std::set<util::Date> dates);

  bool Contains(util::Date date) const {
    return dates_.count(date) > 0;
  }

  const std::string& Region() const {
    return region_;
  }

  std::size_t Size() const {
    return dates_.size();
  }

 private:
  std::string          region_;
  std::set<util::Date> dates_;
};

/*
  Merges calendar.holidays with the dates of calendar.holidays_file.

  The file is YAML:
      region: england-and-wales
      dates: ["2025-12-25", "2025-12-26"]

  Throws util::ConfigError on unreadable files, bad dates, or a region that
  disagrees with the configured one.
*/
HolidayCalendar LoadHolidayCalendar(const waterfall::runtime::config::CalendarConfig& config);

} // namespace waterfall::calendar
