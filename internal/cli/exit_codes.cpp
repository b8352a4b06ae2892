#include "exit_codes.hpp"

#include "internal/util/errors.hpp"

namespace waterfall::cli {

int ToExitCode(core::RunOutcome outcome) {
  switch (outcome) {
    case core::RunOutcome::kExecuted:
    case core::RunOutcome::kNotDue:
    case core::RunOutcome::kSkipped:
      return kExitOk;
    case core::RunOutcome::kPartialFailure:
      return kExitPartialFailure;
    case core::RunOutcome::kBusy:
      return kExitBusy;
  }
  return kExitInternal;
}

int ToExitCode(const std::exception& e) {
  using namespace waterfall::util;

  if (dynamic_cast<const ConfigError*>(&e)) {
    return kExitConfigError;
  }
  if (dynamic_cast<const CalendarError*>(&e)) {
    return kExitCalendarError;
  }
  if (dynamic_cast<const GatewayError*>(&e)) {
    return kExitGatewayError;
  }
  if (dynamic_cast<const LockContention*>(&e)) {
    return kExitBusy;
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return kExitInvalidState;
  }

  return kExitInternal;
}

} // namespace waterfall::cli
