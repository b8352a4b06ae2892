#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace {

using waterfall::util::FormatAmount;
using waterfall::util::FormatDate;
using waterfall::util::ParseDate;

bool Rejects(const std::string& text) {
  try {
    (void)ParseDate(text);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestDateRoundTrip() {
  const auto date = ParseDate("2026-02-26");
  assert(FormatDate(date) == "2026-02-26");
  assert(date == waterfall::util::MakeDate(2026, 2, 26));
  assert(FormatDate(ParseDate("0999-01-01")) == "0999-01-01");
}

void TestMalformedDatesAreRejected() {
  assert(Rejects(""));
  assert(Rejects("2026-2-26"));
  assert(Rejects("2026/02/26"));
  assert(Rejects("2026-02-30"));
  assert(Rejects("2025-02-29"));
  assert(Rejects("2026-13-01"));
  assert(Rejects("20x6-01-01"));
  assert(!Rejects("2024-02-29"));
}

void TestMonthHelpers() {
  using std::chrono::February;
  using std::chrono::year;

  assert(waterfall::util::DaysInMonth(year{2024} / February) == 29);
  assert(waterfall::util::DaysInMonth(year{2026} / February) == 28);
  assert(FormatDate(waterfall::util::LastDayOfMonth(year{2026} / February)) == "2026-02-28");
}

void TestFormatAmount() {
  assert(FormatAmount(123456) == "GBP 1234.56");
  assert(FormatAmount(0) == "GBP 0.00");
  assert(FormatAmount(7, "EUR") == "EUR 0.07");
  assert(FormatAmount(-5) == "GBP -0.05");
  assert(FormatAmount(-100050, "USD") == "USD -1000.50");
}

} // namespace

int main() {
  TestDateRoundTrip();
  TestMalformedDatesAreRejected();
  TestMonthHelpers();
  TestFormatAmount();

  std::cout << "waterfall_unit_time_money: pass\n";
  return 0;
}
