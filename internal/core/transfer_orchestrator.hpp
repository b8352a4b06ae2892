#pragma once

#include <memory>
#include <optional>

#include "internal/core/run_result.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace waterfall::calendar {
class HolidayCalendar;
}
namespace waterfall::db {
class ScheduleRepository;
class Transaction;
}
namespace waterfall::gateway {
class BankingGateway;
}

namespace waterfall::core {

struct OrchestratorOptions {
  // Minor units left in the main account; available = max(0, balance - reserve).
  util::Amount reserve = 0;

  // Available == 0 marks the cycle Skipped instead of Executed.
  bool skip_on_empty = false;
};

/*
  Runs one pay cycle end to end:

      lock schedule → due? → read balances → allocate → transfer → advance → commit

  The schedule lock is held for the whole run; a second concurrent run
  returns Busy without touching anything.

  Failure policy:
    - ConfigError / CalendarError are raised before any gateway call
    - GatewayError while reading propagates; schedule untouched
    - failed transfers give PartialFailure and leave the cycle Pending; the
      next run recomputes need from live balances, so only pots still short
      are funded again
*/
class TransferOrchestrator {
 public:
  TransferOrchestrator(std::shared_ptr<db::ScheduleRepository> repository, std::shared_ptr<gateway::BankingGateway> gateway,
                       std::shared_ptr<const calendar::HolidayCalendar> calendar, OrchestratorOptions options);

  RunResult Run(util::Date now, RunOptions options = {});

  // Plan for the current cycle from live balances; nothing is transferred or
  // persisted.
  Preview PreviewRun(util::Date now);

  // Balances straight from the gateway, pots in priority order.
  AccountSnapshot ReadAccounts(util::Date now);

  // Operator actions. All take the schedule lock and throw
  // util::LockContention when it is held.
  RunResult       Skip(util::Date now);
  model::Schedule Advance();
  model::Schedule Reset(util::Date now, std::optional<util::Date> next_payment_date);
  ScheduleView    Status(util::Date now);

  const OrchestratorOptions& Options() const {
    return options_;
  }

 private:
  void Persist(db::Transaction& tx, const model::Schedule& schedule);

  std::shared_ptr<db::ScheduleRepository>          repository_;
  std::shared_ptr<gateway::BankingGateway>         gateway_;
  std::shared_ptr<const calendar::HolidayCalendar> calendar_;
  OrchestratorOptions                              options_;
};

} // namespace waterfall::core
