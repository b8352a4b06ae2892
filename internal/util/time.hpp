#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace waterfall::util {

/*
  Time utilities. Date parsing and formatting live here too.

  Calendar dates are days since the epoch (std::chrono::sys_days) and are
  always interpreted in UTC. Text form is ISO-8601 YYYY-MM-DD.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::sys_days;

TimePoint Now();
Date      Today();

uint64_t ToUnixMillis(TimePoint tp);

// Throws std::invalid_argument on anything but a valid YYYY-MM-DD date.
Date        ParseDate(std::string_view text);
std::string FormatDate(Date date);

// Throws std::invalid_argument if the triple is not a real calendar date.
Date MakeDate(int year, unsigned month, unsigned day);

Date     LastDayOfMonth(std::chrono::year_month ym);
unsigned DaysInMonth(std::chrono::year_month ym);

} // namespace waterfall::util
