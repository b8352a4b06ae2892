#include "time.hpp"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>

namespace waterfall::util {

namespace {

bool ParseDigits(std::string_view text, int* out) {
  int value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
    value = value * 10 + (c - '0');
  }
  *out = value;
  return true;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

Date Today() {
  return std::chrono::floor<std::chrono::days>(Now());
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Date ParseDate(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    throw std::invalid_argument("invalid date '" + std::string(text) + "': expected YYYY-MM-DD");
  }

  int year  = 0;
  int month = 0;
  int day   = 0;
  if (!ParseDigits(text.substr(0, 4), &year) || !ParseDigits(text.substr(5, 2), &month) || !ParseDigits(text.substr(8, 2), &day)) {
    throw std::invalid_argument("invalid date '" + std::string(text) + "': non-digit character");
  }

  return MakeDate(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

std::string FormatDate(Date date) {
  const std::chrono::year_month_day ymd{date};
  return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

Date MakeDate(int year, unsigned month, unsigned day) {
  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
  if (!ymd.ok()) {
    throw std::invalid_argument(fmt::format("invalid calendar date {:04}-{:02}-{:02}", year, month, day));
  }
  return Date{ymd};
}

Date LastDayOfMonth(std::chrono::year_month ym) {
  return Date{std::chrono::year_month_day_last{ym.year(), std::chrono::month_day_last{ym.month()}}};
}

unsigned DaysInMonth(std::chrono::year_month ym) {
  return static_cast<unsigned>(std::chrono::year_month_day_last{ym.year(), std::chrono::month_day_last{ym.month()}}.day());
}

} // namespace waterfall::util
