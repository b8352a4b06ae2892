#pragma once

#include <exception>
#include <ostream>
#include <string_view>

#include "internal/core/run_result.hpp"

namespace waterfall::report {

/*
  Human-readable tables for the CLI, 53 columns wide.

  Amounts are printed in major units with the configured currency code.
*/

void PrintBalances(std::ostream& out, const core::AccountSnapshot& accounts, std::string_view currency);
void PrintPlan(std::ostream& out, const model::TransferPlan& plan, std::string_view currency);
void PrintPreview(std::ostream& out, const core::Preview& preview, std::string_view currency);
void PrintSchedule(std::ostream& out, const core::ScheduleView& view);
void PrintSchedule(std::ostream& out, const model::Schedule& schedule);
void PrintRunResult(std::ostream& out, const core::RunResult& result, std::string_view currency);

// For runs that ended in an exception: nothing was funded, say why.
void PrintFailure(std::ostream& out, const std::exception& e);

} // namespace waterfall::report
