#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/util/time.hpp"

namespace waterfall::model {

enum class ScheduleStatus : std::uint8_t {
  kPending  = 1,
  kExecuted = 2,
  kSkipped  = 3,
};

constexpr bool IsTerminal(ScheduleStatus status) {
  return status == ScheduleStatus::kExecuted || status == ScheduleStatus::kSkipped;
}

// Pending -> Executed | Skipped, and back to Pending only from a terminal status
// (the advance to the next cycle).
constexpr bool CanTransition(ScheduleStatus from, ScheduleStatus to) {
  if (from == ScheduleStatus::kPending) {
    return IsTerminal(to);
  }
  return to == ScheduleStatus::kPending;
}

constexpr std::string_view ToString(ScheduleStatus status) {
  switch (status) {
    case ScheduleStatus::kPending:
      return "pending";
    case ScheduleStatus::kExecuted:
      return "executed";
    case ScheduleStatus::kSkipped:
      return "skipped";
  }
  return "unknown";
}

struct Schedule {
  util::Date                next_payment_date{};
  std::optional<util::Date> last_executed_date;
  ScheduleStatus            status = ScheduleStatus::kPending;

  bool operator==(const Schedule&) const = default;
};

} // namespace waterfall::model
