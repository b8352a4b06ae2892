#pragma once

#include <chrono>

#include "internal/calendar/holiday_calendar.hpp"
#include "internal/util/time.hpp"

namespace waterfall::calendar {

/*
  Payday resolution under the "last working day of the month" rule.

  All functions are pure: the same month and calendar always give the same
  payday, whatever day the program runs on.
*/

// The last day of the month and at most this many days before it are examined.
inline constexpr int kMaxLookbackDays = 10;

bool IsWeekend(util::Date date);
bool IsWorkingDay(util::Date date, const HolidayCalendar& calendar);

// Throws util::CalendarError when no working day is found within the lookback.
util::Date LastWorkingDay(std::chrono::year_month ym, const HolidayCalendar& calendar);
util::Date LastWorkingDay(int year, unsigned month, const HolidayCalendar& calendar);

// Payday of the month containing date.
util::Date PaydayOf(util::Date date, const HolidayCalendar& calendar);

// Payday of the month after the one containing date. Always later than
// PaydayOf(date).
util::Date PaydayAfter(util::Date date, const HolidayCalendar& calendar);

inline bool IsDue(util::Date today, util::Date next_payment_date) {
  return today >= next_payment_date;
}

} // namespace waterfall::calendar
