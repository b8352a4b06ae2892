#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

namespace waterfall::calendar {
class HolidayCalendar;
}
namespace waterfall::db {
class ScheduleRepository;
}
namespace waterfall::gateway {
class BankingGateway;
}
namespace waterfall::core {
class TransferOrchestrator;
}

namespace waterfall::factory {

/*
  Runtime

  Everything one invocation needs, built once from config.
*/
struct Runtime {
  std::shared_ptr<const calendar::HolidayCalendar> calendar;
  std::shared_ptr<db::ScheduleRepository>          repository;
  std::shared_ptr<gateway::BankingGateway>         gateway;
  std::shared_ptr<core::TransferOrchestrator>      orchestrator;
  std::string                                      currency;
};

/*
  BuildRuntime

  Constructs the engine based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store and gateway types.
*/
Runtime BuildRuntime(const waterfall::runtime::config::RuntimeConfig& config);

} // namespace waterfall::factory
