#include "calendar_resolver.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/util/errors.hpp"

namespace waterfall::calendar {

namespace {

std::chrono::year_month MonthOf(util::Date date) {
  const std::chrono::year_month_day ymd{date};
  return ymd.year() / ymd.month();
}

} // namespace

bool IsWeekend(util::Date date) {
  const std::chrono::weekday wd{date};
  return wd == std::chrono::Saturday || wd == std::chrono::Sunday;
}

bool IsWorkingDay(util::Date date, const HolidayCalendar& calendar) {
  return !IsWeekend(date) && !calendar.Contains(date);
}

util::Date LastWorkingDay(std::chrono::year_month ym, const HolidayCalendar& calendar) {
  if (!ym.ok()) {
    throw util::CalendarError(fmt::format("invalid month {}-{}", static_cast<int>(ym.year()), static_cast<unsigned>(ym.month())));
  }

  const util::Date last = util::LastDayOfMonth(ym);
  for (int back = 0; back <= kMaxLookbackDays; ++back) {
    const util::Date candidate = last - std::chrono::days{back};
    if (IsWorkingDay(candidate, calendar)) {
      return candidate;
    }
  }

  throw util::CalendarError(fmt::format("no working day in the last {} days of {:04}-{:02} (region '{}')", kMaxLookbackDays + 1,
                                        static_cast<int>(ym.year()), static_cast<unsigned>(ym.month()), calendar.Region()));
}

util::Date LastWorkingDay(int year, unsigned month, const HolidayCalendar& calendar) {
  return LastWorkingDay(std::chrono::year{year} / std::chrono::month{month}, calendar);
}

util::Date PaydayOf(util::Date date, const HolidayCalendar& calendar) {
  return LastWorkingDay(MonthOf(date), calendar);
}

util::Date PaydayAfter(util::Date date, const HolidayCalendar& calendar) {
  return LastWorkingDay(MonthOf(date) + std::chrono::months{1}, calendar);
}

} // namespace waterfall::calendar
