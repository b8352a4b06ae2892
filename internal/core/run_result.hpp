#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/pot.hpp"
#include "internal/model/schedule.hpp"
#include "internal/model/transfer_plan.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace waterfall::core {

enum class RunOutcome : std::uint8_t {
  kExecuted,
  kNotDue,
  kSkipped,
  kPartialFailure,
  kBusy,
};

constexpr std::string_view ToString(RunOutcome outcome) {
  switch (outcome) {
    case RunOutcome::kExecuted:
      return "executed";
    case RunOutcome::kNotDue:
      return "not-due";
    case RunOutcome::kSkipped:
      return "skipped";
    case RunOutcome::kPartialFailure:
      return "partial-failure";
    case RunOutcome::kBusy:
      return "busy";
  }
  return "unknown";
}

struct UnfundedPot {
  std::string  pot_id;
  std::string  pot_name;
  util::Amount amount = 0;
  std::string  reason;
};

struct RunResult {
  RunOutcome outcome = RunOutcome::kNotDue;

  // Payday of the cycle this run looked at.
  std::optional<util::Date> cycle_date;

  // Schedule as left by the run (absent for Busy).
  std::optional<model::Schedule> schedule;

  std::optional<model::TransferPlan> plan;
  util::Amount                       transferred = 0;
  std::vector<UnfundedPot>           unfunded;

  std::string detail;
};

struct RunOptions {
  // Ignore the due date; a cycle that is not Pending is still left alone.
  bool force = false;
};

struct AccountSnapshot {
  model::MainAccountSnapshot main;
  std::vector<model::Pot>    pots; // ascending priority
};

struct ScheduleView {
  model::Schedule schedule;
  bool            persisted = false;
  bool            due       = false;
};

struct Preview {
  ScheduleView        schedule;
  AccountSnapshot     accounts;
  util::Amount        reserve   = 0;
  util::Amount        available = 0;
  util::Amount        total_need = 0;
  model::TransferPlan plan;
};

} // namespace waterfall::core
