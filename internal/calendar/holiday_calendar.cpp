#include "holiday_calendar.hpp"

#include <stdexcept>

#include "config/config.pb.h"
#include "internal/config/yaml_proto.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace waterfall::calendar {

using waterfall::util::ConfigError;

namespace {

void AddDate(const std::string& text, const std::string& origin, std::set<util::Date>* dates) {
  try {
    dates->insert(util::ParseDate(text));
  } catch (const std::invalid_argument& e) {
    throw ConfigError(origin + ": " + e.what());
  }
}

} // namespace

HolidayCalendar::HolidayCalendar(std::string region, std::set<util::Date> dates) : region_(std::move(region)), dates_(std::move(dates)) {
}

HolidayCalendar LoadHolidayCalendar(const waterfall::runtime::config::CalendarConfig& config) {
  std::string          region = config.region();
  std::set<util::Date> dates;

  for (const auto& holiday : config.holidays()) {
    AddDate(holiday, "calendar.holidays", &dates);
  }

  if (!config.holidays_file().empty()) {
    waterfall::runtime::config::HolidayFile file;
    try {
      waterfall::config::LoadYamlFile(config.holidays_file(), &file);
    } catch (const std::exception& e) {
      throw ConfigError("calendar.holidays_file: " + std::string(e.what()));
    }

    if (!file.region().empty()) {
      if (region.empty()) {
        region = file.region();
      } else if (region != file.region()) {
        throw ConfigError("calendar.holidays_file is for region '" + file.region() + "' but calendar.region is '" + region + "'");
      }
    }

    for (const auto& holiday : file.dates()) {
      AddDate(holiday, config.holidays_file(), &dates);
    }
  }

  WATERFALL_LOG_DEBUG("Holiday calendar loaded",
                      {observability::StringField("region", region), observability::IntField("holidays", static_cast<std::int64_t>(dates.size()))});

  return HolidayCalendar(std::move(region), std::move(dates));
}

} // namespace waterfall::calendar
