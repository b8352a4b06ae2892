#include "report_printer.hpp"

#include <spdlog/fmt/fmt.h>

#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace waterfall::report {

namespace {

constexpr std::size_t kWidth = 53;

void Rule(std::ostream& out, char c) {
  out << std::string(kWidth, c) << '\n';
}

std::string Clip(std::string_view text, std::size_t width) {
  if (text.size() <= width) return std::string(text);
  return std::string(text.substr(0, width - 1)) + "~";
}

void Row(std::ostream& out, std::string_view label, std::string_view value) {
  out << fmt::format("{:<36} {:>16}\n", Clip(label, 36), value);
}

} // namespace

void PrintBalances(std::ostream& out, const core::AccountSnapshot& accounts, std::string_view currency) {
  Rule(out, '=');
  Row(out, "Account", "Balance");
  Rule(out, '-');
  Row(out, "Main balance:", util::FormatAmount(accounts.main.balance, currency));
  Rule(out, '=');
  out << '\n';

  if (accounts.pots.empty()) {
    out << "No savings pots found.\n\n";
    return;
  }

  Rule(out, '=');
  out << fmt::format("{:<18} {:>4} {:>14} {:>14}\n", "Savings Pots", "Prio", "Balance", "Target");
  Rule(out, '-');
  for (const auto& pot : accounts.pots) {
    out << fmt::format("{:<18} {:>4} {:>14} {:>14}\n", Clip(pot.name.empty() ? pot.id : pot.name, 18), pot.priority,
                       util::FormatAmount(pot.balance, currency), util::FormatAmount(pot.target, currency));
  }
  Rule(out, '=');
  out << '\n';
}

void PrintPlan(std::ostream& out, const model::TransferPlan& plan, std::string_view currency) {
  Rule(out, '=');
  Row(out, "Waterfall plan for payday", util::FormatDate(plan.payday));
  Rule(out, '-');
  out << fmt::format("{:<22} {:>14} {:>15}\n", "Pot", "Need", "Transfer");
  for (const auto& entry : plan.entries) {
    out << fmt::format("{:<22} {:>14} {:>15}\n", Clip(entry.pot_name.empty() ? entry.pot_id : entry.pot_name, 22),
                       util::FormatAmount(entry.need, currency), util::FormatAmount(entry.amount, currency));
  }
  Rule(out, '-');
  Row(out, "Available:", util::FormatAmount(plan.available, currency));
  Row(out, "Planned transfers:", util::FormatAmount(plan.Total(), currency));
  Row(out, "Remaining in main account:", util::FormatAmount(plan.Remaining(), currency));
  Rule(out, '=');

  bool header = false;
  for (const auto& entry : plan.entries) {
    if (entry.amount >= entry.need) continue;
    if (!header) {
      out << "Short of target after this cycle:\n";
      header = true;
    }
    out << fmt::format("  {:<22} {:>14} short\n", Clip(entry.pot_name.empty() ? entry.pot_id : entry.pot_name, 22),
                       util::FormatAmount(entry.need - entry.amount, currency));
  }
  out << '\n';
}

void PrintPreview(std::ostream& out, const core::Preview& preview, std::string_view currency) {
  PrintSchedule(out, preview.schedule);
  PrintBalances(out, preview.accounts, currency);

  Rule(out, '=');
  Row(out, "Waterfall Total", "Amount");
  Rule(out, '-');
  Row(out, "Total needed to reach all targets:", util::FormatAmount(preview.total_need, currency));
  Row(out, "Reserve kept in main account:", util::FormatAmount(preview.reserve, currency));
  Rule(out, '=');
  out << '\n';

  PrintPlan(out, preview.plan, currency);
}

void PrintSchedule(std::ostream& out, const core::ScheduleView& view) {
  PrintSchedule(out, view.schedule);
  if (!view.persisted) {
    out << "(no schedule stored yet; the first run will create it)\n";
  }
  out << (view.due ? "Cycle is due.\n" : "Cycle is not due yet.\n") << '\n';
}

void PrintSchedule(std::ostream& out, const model::Schedule& schedule) {
  Rule(out, '=');
  Row(out, "Schedule", "");
  Rule(out, '-');
  Row(out, "Next payment date:", util::FormatDate(schedule.next_payment_date));
  Row(out, "Last executed:", schedule.last_executed_date ? util::FormatDate(*schedule.last_executed_date) : "never");
  Row(out, "Status:", model::ToString(schedule.status));
  Rule(out, '=');
}

void PrintRunResult(std::ostream& out, const core::RunResult& result, std::string_view currency) {
  out << "Outcome: " << core::ToString(result.outcome);
  if (result.cycle_date) {
    out << " (cycle " << util::FormatDate(*result.cycle_date) << ")";
  }
  out << '\n';
  if (!result.detail.empty()) {
    out << result.detail << '\n';
  }
  out << '\n';

  if (result.plan) {
    PrintPlan(out, *result.plan, currency);
  }

  switch (result.outcome) {
    case core::RunOutcome::kExecuted:
      out << "Transferred " << util::FormatAmount(result.transferred, currency) << ".\n";
      break;
    case core::RunOutcome::kPartialFailure:
      out << "Transferred " << util::FormatAmount(result.transferred, currency) << "; these pots remain unfunded:\n";
      for (const auto& pot : result.unfunded) {
        out << fmt::format("  {:<22} {:>14}  {}\n", Clip(pot.pot_name.empty() ? pot.pot_id : pot.pot_name, 22), util::FormatAmount(pot.amount, currency),
                           pot.reason);
      }
      out << "The cycle stays pending; the next run retries using fresh balances.\n";
      break;
    case core::RunOutcome::kBusy:
      out << "Another run holds the schedule; no pots were funded by this invocation.\n";
      break;
    case core::RunOutcome::kSkipped:
      out << "No transfers were made for this cycle.\n";
      break;
    case core::RunOutcome::kNotDue:
      break;
  }

  if (result.schedule) {
    out << '\n';
    PrintSchedule(out, *result.schedule);
  }
}

void PrintFailure(std::ostream& out, const std::exception& e) {
  if (dynamic_cast<const util::GatewayError*>(&e)) {
    out << "No pots were funded: the bank could not be reached (" << e.what() << ").\n"
        << "The cycle stays pending and will be retried on the next run.\n";
    return;
  }
  if (dynamic_cast<const util::ConfigError*>(&e) || dynamic_cast<const util::CalendarError*>(&e)) {
    out << "No pots were funded: " << e.what() << "\n"
        << "Nothing was sent to the bank.\n";
    return;
  }
  out << "Run aborted: " << e.what() << "\n"
      << "The cycle stays pending.\n";
}

} // namespace waterfall::report
