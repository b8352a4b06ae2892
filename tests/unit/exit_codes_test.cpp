#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/cli/exit_codes.hpp"
#include "internal/util/errors.hpp"

int main() {
  using namespace waterfall;
  using core::RunOutcome;

  assert(cli::ToExitCode(RunOutcome::kExecuted) == 0);
  assert(cli::ToExitCode(RunOutcome::kNotDue) == 0);
  assert(cli::ToExitCode(RunOutcome::kSkipped) == 0);
  assert(cli::ToExitCode(RunOutcome::kPartialFailure) == cli::kExitPartialFailure);
  assert(cli::ToExitCode(RunOutcome::kBusy) == cli::kExitBusy);

  assert(cli::ToExitCode(util::ConfigError("bad")) == cli::kExitConfigError);
  assert(cli::ToExitCode(util::CalendarError("bad")) == cli::kExitCalendarError);
  assert(cli::ToExitCode(util::GatewayError("bad", true)) == cli::kExitGatewayError);
  assert(cli::ToExitCode(util::LockContention("bad")) == cli::kExitBusy);
  assert(cli::ToExitCode(util::InvalidState("bad")) == cli::kExitInvalidState);
  assert(cli::ToExitCode(std::runtime_error("bad")) == cli::kExitInternal);

  // every failure is distinguishable from success
  static_assert(cli::kExitPartialFailure != cli::kExitOk);
  static_assert(cli::kExitBusy != cli::kExitOk);

  std::cout << "waterfall_unit_exit_codes: pass\n";
  return 0;
}
