#include "transfer_orchestrator.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "internal/allocation/waterfall_allocator.hpp"
#include "internal/calendar/calendar_resolver.hpp"
#include "internal/calendar/holiday_calendar.hpp"
#include "internal/db/api/schedule_repository.hpp"
#include "internal/gateway/banking_gateway.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schedule/schedule_machine.hpp"
#include "internal/util/errors.hpp"

namespace waterfall::core {

using waterfall::observability::AmountField;
using waterfall::observability::BoolField;
using waterfall::observability::DateField;
using waterfall::observability::IntField;
using waterfall::observability::StringField;
using waterfall::schedule::ScheduleMachine;

namespace {

struct LoadedSchedule {
  model::Schedule schedule;
  bool            persisted = false;
};

LoadedSchedule LoadOrInitialize(db::ScheduleRepository& repository, db::Transaction& tx, util::Date now,
                                const calendar::HolidayCalendar& calendar) {
  if (auto stored = repository.Load(tx)) {
    return {*stored, true};
  }
  return {ScheduleMachine::Initial(now, calendar), false};
}

} // namespace

TransferOrchestrator::TransferOrchestrator(std::shared_ptr<db::ScheduleRepository> repository, std::shared_ptr<gateway::BankingGateway> gateway,
                                           std::shared_ptr<const calendar::HolidayCalendar> calendar, OrchestratorOptions options)
    : repository_(std::move(repository)), gateway_(std::move(gateway)), calendar_(std::move(calendar)), options_(options) {
  if (!repository_ || !gateway_ || !calendar_) {
    throw std::invalid_argument("TransferOrchestrator requires a repository, a gateway and a calendar");
  }
  if (options_.reserve < 0) {
    throw util::ConfigError("reserve must not be negative");
  }
}

RunResult TransferOrchestrator::Run(util::Date now, RunOptions run_options) {
  RunResult result;

  std::unique_ptr<db::Transaction> tx;
  try {
    tx = repository_->Begin();
  } catch (const util::LockContention& e) {
    WATERFALL_LOG_WARN("Run skipped: schedule busy", {StringField("error", e.what())});
    result.outcome = RunOutcome::kBusy;
    result.detail  = e.what();
    return result;
  }

  auto loaded = LoadOrInitialize(*repository_, *tx, now, *calendar_);
  if (!loaded.persisted) {
    Persist(*tx, loaded.schedule);
    WATERFALL_LOG_INFO("Schedule initialized", {DateField("next_payment_date", loaded.schedule.next_payment_date)});
  }

  ScheduleMachine machine(loaded.schedule, *calendar_);
  const util::Date cycle = machine.Current().next_payment_date;
  result.cycle_date      = cycle;

  if (machine.Current().status != model::ScheduleStatus::kPending) {
    result.outcome  = RunOutcome::kNotDue;
    result.detail   = "cycle " + util::FormatDate(cycle) + " is already " + std::string(model::ToString(machine.Current().status));
    result.schedule = machine.Current();
    tx->Commit();
    WATERFALL_LOG_INFO("Nothing to do", {StringField("reason", result.detail)});
    return result;
  }

  if (!run_options.force && !calendar::IsDue(now, cycle)) {
    result.outcome  = RunOutcome::kNotDue;
    result.detail   = "next payment date is " + util::FormatDate(cycle);
    result.schedule = machine.Current();
    tx->Commit();
    WATERFALL_LOG_INFO("Cycle not due", {DateField("today", now), DateField("next_payment_date", cycle)});
    return result;
  }

  // Resolve the following payday now so a broken holiday calendar stops the
  // run before anything is sent.
  const util::Date following = calendar::PaydayAfter(cycle, *calendar_);

  WATERFALL_LOG_INFO("Cycle due", {DateField("cycle", cycle), DateField("following", following), BoolField("forced", run_options.force)});

  const auto accounts  = ReadAccounts(now);
  const auto available = std::max<util::Amount>(0, accounts.main.balance - options_.reserve);
  auto       plan      = allocation::Allocate(available, accounts.pots, cycle);

  WATERFALL_LOG_INFO("Plan computed", {AmountField("main_balance", accounts.main.balance), AmountField("available", available),
                                       AmountField("planned", plan.Total()), IntField("pots", static_cast<std::int64_t>(plan.entries.size()))});

  if (available == 0 && options_.skip_on_empty) {
    machine.MarkSkipped();
    machine.Advance();
    Persist(*tx, machine.Current());
    tx->Commit();

    result.outcome  = RunOutcome::kSkipped;
    result.detail   = "no funds available above the reserve";
    result.plan     = std::move(plan);
    result.schedule = machine.Current();
    return result;
  }

  for (const auto& entry : plan.NonZeroEntries()) {
    gateway::TransferStatus status;
    try {
      status = gateway_->TransferToPot(entry.pot_id, entry.amount);
    } catch (const util::GatewayError& e) {
      status = gateway::TransferStatus::Failed(e.what());
    }

    if (status) {
      result.transferred += entry.amount;
      WATERFALL_LOG_INFO("Transfer sent", {StringField("pot", entry.pot_id), AmountField("amount", entry.amount)});
    } else {
      result.unfunded.push_back(UnfundedPot{entry.pot_id, entry.pot_name, entry.amount, status.reason});
      WATERFALL_LOG_ERROR("Transfer failed", {StringField("pot", entry.pot_id), AmountField("amount", entry.amount), StringField("error", status.reason)});
    }
  }
  result.plan = std::move(plan);

  // The schedule lock is held until no transfer is in flight at the bank.
  gateway_->AwaitIdle();

  if (!result.unfunded.empty()) {
    // Cycle stays Pending; only an initialization (if any) is committed.
    tx->Commit();
    result.outcome  = RunOutcome::kPartialFailure;
    result.detail   = std::to_string(result.unfunded.size()) + " transfer(s) failed; cycle left pending for retry";
    result.schedule = machine.Current();
    return result;
  }

  machine.MarkExecuted(now);
  machine.Advance();
  Persist(*tx, machine.Current());
  tx->Commit();

  result.outcome  = RunOutcome::kExecuted;
  result.schedule = machine.Current();
  WATERFALL_LOG_INFO("Cycle executed",
                     {DateField("cycle", cycle), AmountField("transferred", result.transferred), DateField("next_payment_date", following)});
  return result;
}

AccountSnapshot TransferOrchestrator::ReadAccounts(util::Date now) {
  AccountSnapshot snapshot;
  snapshot.main.balance  = gateway_->GetMainBalance();
  snapshot.main.taken_on = now;
  snapshot.pots          = gateway_->ListPots();
  allocation::SortByPriority(&snapshot.pots);
  return snapshot;
}

Preview TransferOrchestrator::PreviewRun(util::Date now) {
  Preview preview;
  preview.schedule = Status(now);
  preview.accounts = ReadAccounts(now);
  preview.reserve  = options_.reserve;

  preview.available  = std::max<util::Amount>(0, preview.accounts.main.balance - options_.reserve);
  preview.plan       = allocation::Allocate(preview.available, preview.accounts.pots, preview.schedule.schedule.next_payment_date);
  preview.total_need = allocation::TotalNeed(preview.accounts.pots);
  return preview;
}

RunResult TransferOrchestrator::Skip(util::Date now) {
  auto tx     = repository_->Begin();
  auto loaded = LoadOrInitialize(*repository_, *tx, now, *calendar_);

  ScheduleMachine machine(loaded.schedule, *calendar_);
  const util::Date cycle = machine.Current().next_payment_date;

  machine.MarkSkipped();
  machine.Advance();
  Persist(*tx, machine.Current());
  tx->Commit();

  WATERFALL_LOG_WARN("Cycle skipped by operator", {DateField("cycle", cycle), DateField("next_payment_date", machine.Current().next_payment_date)});

  RunResult result;
  result.outcome    = RunOutcome::kSkipped;
  result.cycle_date = cycle;
  result.schedule   = machine.Current();
  result.detail     = "skipped by operator";
  return result;
}

model::Schedule TransferOrchestrator::Advance() {
  auto tx     = repository_->Begin();
  auto stored = repository_->Load(*tx);
  if (!stored) {
    throw util::InvalidState("no schedule stored yet; nothing to advance");
  }

  ScheduleMachine machine(*stored, *calendar_);
  machine.Advance();
  Persist(*tx, machine.Current());
  tx->Commit();
  return machine.Current();
}

model::Schedule TransferOrchestrator::Reset(util::Date now, std::optional<util::Date> next_payment_date) {
  auto tx     = repository_->Begin();
  auto loaded = LoadOrInitialize(*repository_, *tx, now, *calendar_);

  const util::Date target = next_payment_date ? *next_payment_date : ScheduleMachine::Initial(now, *calendar_).next_payment_date;

  ScheduleMachine machine(loaded.schedule, *calendar_);
  machine.Reset(target);
  Persist(*tx, machine.Current());
  tx->Commit();
  return machine.Current();
}

ScheduleView TransferOrchestrator::Status(util::Date now) {
  auto tx     = repository_->Begin();
  auto loaded = LoadOrInitialize(*repository_, *tx, now, *calendar_);
  tx->Rollback();

  ScheduleView view;
  view.schedule  = loaded.schedule;
  view.persisted = loaded.persisted;
  view.due       = ScheduleMachine(loaded.schedule, *calendar_).IsDue(now);
  return view;
}

void TransferOrchestrator::Persist(db::Transaction& tx, const model::Schedule& schedule) {
  auto saved = repository_->Save(tx, schedule);
  if (!saved) {
    throw std::runtime_error("failed to persist schedule: " + saved.Describe());
  }
}

} // namespace waterfall::core
