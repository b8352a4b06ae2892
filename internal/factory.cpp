#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

#include "internal/calendar/holiday_calendar.hpp"
#include "internal/core/transfer_orchestrator.hpp"
#include "internal/db/api/schedule_repository.hpp"
#include "internal/db/file/file_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/gateway/deadline_gateway.hpp"
#include "internal/gateway/ledger_gateway.hpp"
#include "internal/gateway/memory_gateway.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if WATERFALL_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace waterfall::factory {

using waterfall::observability::IntField;
using waterfall::observability::StringField;
using waterfall::runtime::config::GatewayConfig;
using waterfall::runtime::config::RuntimeConfig;
using waterfall::runtime::config::ScheduleConfig;

namespace {

std::shared_ptr<db::ScheduleRepository> BuildRepository(const ScheduleConfig& config) {
  switch (config.store_case()) {
    case ScheduleConfig::kFile:
      WATERFALL_LOG_DEBUG("Schedule store", {StringField("backend", "file"), StringField("path", config.file().path())});
      return std::make_shared<db::file::FileRepository>(config.file().path());

    case ScheduleConfig::kSqlite: {
#if WATERFALL_DB_SQLITE
      WATERFALL_LOG_DEBUG("Schedule store", {StringField("backend", "sqlite"), StringField("path", config.sqlite().path())});
      auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(config.sqlite().path());
      db::sqlite::BootstrapSchema(*sqlite_db);
      return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
      throw util::ConfigError("sqlite schedule store requested but not enabled at build time");
#endif
    }

    case ScheduleConfig::kMemory:
      WATERFALL_LOG_WARN("Schedule store is in-memory; state is lost when the process exits");
      return std::make_shared<db::memory::MemoryRepository>();

    default:
      throw util::ConfigError("schedule store must be one of: file, sqlite, memory");
  }
}

std::shared_ptr<gateway::BankingGateway> BuildGateway(const GatewayConfig& config) {
  std::shared_ptr<gateway::BankingGateway> backend;

  switch (config.backend_case()) {
    case GatewayConfig::kLedger:
      backend = std::make_shared<gateway::LedgerGateway>(config.ledger().path());
      break;

    case GatewayConfig::kSandbox: {
      std::vector<model::Pot> pots;
      for (const auto& pot : config.sandbox().pots()) {
        pots.push_back(model::Pot{pot.id(), pot.name().empty() ? pot.id() : pot.name(), pot.balance(), pot.target(), pot.priority()});
      }
      backend = std::make_shared<gateway::MemoryGateway>(config.sandbox().main_balance(), std::move(pots));
      break;
    }

    default:
      throw util::ConfigError("gateway backend must be one of: ledger, sandbox");
  }

  WATERFALL_LOG_DEBUG("Gateway", {StringField("backend", config.has_ledger() ? "ledger" : "sandbox"), IntField("timeout_ms", config.timeout_ms())});
  return std::make_shared<gateway::DeadlineGateway>(std::move(backend), std::chrono::milliseconds(config.timeout_ms()));
}

} // namespace

/*
    Build full dependency graph
*/
Runtime BuildRuntime(const RuntimeConfig& config) {
  Runtime runtime;

  runtime.calendar   = std::make_shared<const calendar::HolidayCalendar>(calendar::LoadHolidayCalendar(config.calendar()));
  runtime.repository = BuildRepository(config.schedule());
  runtime.gateway    = BuildGateway(config.gateway());
  runtime.currency   = config.allocation().currency();

  core::OrchestratorOptions options;
  options.reserve       = config.allocation().reserve();
  options.skip_on_empty = config.schedule().skip_on_empty();

  runtime.orchestrator = std::make_shared<core::TransferOrchestrator>(runtime.repository, runtime.gateway, runtime.calendar, options);
  return runtime;
}

} // namespace waterfall::factory
