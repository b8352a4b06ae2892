#pragma once

#include <exception>

#include "internal/core/run_result.hpp"

namespace waterfall::cli {

/*
  Process exit codes shared by both binaries.

  0 means the cycle is in a good state (executed, skipped, or nothing due).
*/
enum ExitCode : int {
  kExitOk             = 0,
  kExitUsage          = 1,
  kExitInternal       = 2,
  kExitPartialFailure = 3,
  kExitBusy           = 4,
  kExitConfigError    = 5,
  kExitCalendarError  = 6,
  kExitGatewayError   = 7,
  kExitInvalidState   = 8,
};

int ToExitCode(core::RunOutcome outcome);

// Maps the util:: error taxonomy; anything else is kExitInternal.
int ToExitCode(const std::exception& e);

} // namespace waterfall::cli
