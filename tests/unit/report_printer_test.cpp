#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/allocation/waterfall_allocator.hpp"
#include "internal/report/report_printer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using waterfall::core::RunOutcome;
using waterfall::core::RunResult;
using waterfall::model::Pot;
using waterfall::util::ParseDate;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestPartialFailureNamesUnfundedPots() {
  RunResult result;
  result.outcome    = RunOutcome::kPartialFailure;
  result.cycle_date = ParseDate("2026-01-30");
  result.plan       = waterfall::allocation::Allocate(70000, {Pot{"A", "Emergency", 0, 50000, 1}, Pot{"B", "Holiday", 0, 30000, 2}},
                                                      ParseDate("2026-01-30"));
  result.transferred = 50000;
  result.unfunded.push_back({"B", "Holiday", 20000, "pot temporarily locked"});

  std::ostringstream out;
  waterfall::report::PrintRunResult(out, result, "GBP");
  const auto text = out.str();

  assert(Contains(text, "Outcome: partial-failure (cycle 2026-01-30)"));
  assert(Contains(text, "GBP 500.00"));
  assert(Contains(text, "pot temporarily locked"));
  assert(Contains(text, "Holiday"));
  assert(Contains(text, "retries"));
  // B ends the cycle short by 100.00
  assert(Contains(text, "Short of target"));
  assert(Contains(text, "GBP 100.00 short"));
}

void TestPreviewShowsTotals() {
  waterfall::core::Preview preview;
  preview.schedule.schedule.next_payment_date = ParseDate("2026-02-26");
  preview.accounts.main.balance               = 123456;
  preview.accounts.pots                       = {Pot{"A", "Emergency", 100, 500, 1}};
  preview.reserve                             = 1000;
  preview.available                           = 122456;
  preview.total_need                          = 400;
  preview.plan = waterfall::allocation::Allocate(preview.available, preview.accounts.pots, ParseDate("2026-02-26"));

  std::ostringstream out;
  waterfall::report::PrintPreview(out, preview, "EUR");
  const auto text = out.str();

  assert(Contains(text, "2026-02-26"));
  assert(Contains(text, "EUR 1234.56"));
  assert(Contains(text, "Waterfall Total"));
  assert(Contains(text, "EUR 4.00"));
  assert(Contains(text, "no schedule stored yet"));
  assert(!Contains(text, "Short of target"));
}

void TestEmptyPots() {
  waterfall::core::AccountSnapshot accounts;
  accounts.main.balance = 0;

  std::ostringstream out;
  waterfall::report::PrintBalances(out, accounts, "GBP");
  assert(Contains(out.str(), "No savings pots found."));
}

void TestFailureMessages() {
  std::ostringstream gateway;
  waterfall::report::PrintFailure(gateway, waterfall::util::GatewayError("timed out", true));
  assert(Contains(gateway.str(), "No pots were funded"));
  assert(Contains(gateway.str(), "retried"));

  std::ostringstream config;
  waterfall::report::PrintFailure(config, waterfall::util::ConfigError("pots 'a' and 'b' share priority 1"));
  assert(Contains(config.str(), "share priority 1"));
  assert(Contains(config.str(), "Nothing was sent"));
}

} // namespace

int main() {
  TestPartialFailureNamesUnfundedPots();
  TestPreviewShowsTotals();
  TestEmptyPots();
  TestFailureMessages();

  std::cout << "waterfall_unit_report_printer: pass\n";
  return 0;
}
