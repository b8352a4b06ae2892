#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/calendar/holiday_calendar.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/transfer_orchestrator.hpp"
#include "internal/factory.hpp"
#include "internal/gateway/banking_gateway.hpp"
#include "internal/gateway/deadline_gateway.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using waterfall::config::ConfigLoader;
using waterfall::core::RunOutcome;
using waterfall::util::FormatDate;
using waterfall::util::ParseDate;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "waterfall_factory_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void TestSandboxWithFileStore() {
  const auto dir = FreshDir("sandbox");

  auto config = ConfigLoader::LoadFromYamlString(R"(schedule:
  file:
    path: ")" + (dir / "schedule.json").string() + R"("
calendar:
  region: test
  holidays: ["2026-02-27"]
allocation:
  reserve: 10000
gateway:
  timeout_ms: 2000
  sandbox:
    main_balance: 80000
    pots:
      - { id: emergency, target: 50000, priority: 1 }
      - { id: holiday, target: 30000, balance: 5000, priority: 2 }
)");

  auto runtime = waterfall::factory::BuildRuntime(config);
  assert(runtime.currency == "GBP");
  assert(runtime.calendar->Size() == 1);
  assert(runtime.orchestrator->Options().reserve == 10000);

  auto deadline = std::dynamic_pointer_cast<waterfall::gateway::DeadlineGateway>(runtime.gateway);
  assert(deadline != nullptr);
  assert(deadline->Timeout() == std::chrono::milliseconds(2000));

  auto result = runtime.orchestrator->Run(ParseDate("2026-01-30"));
  assert(result.outcome == RunOutcome::kExecuted);
  assert(result.transferred == 70000);
  // the holiday on the 27th moves February's payday back a day
  assert(FormatDate(result.schedule->next_payment_date) == "2026-02-26");
  assert(std::filesystem::exists(dir / "schedule.json"));

  assert(runtime.gateway->GetMainBalance() == 10000);
}

void TestLedgerGatewayPersistsAcrossRuntimes() {
  const auto dir    = FreshDir("ledger");
  const auto ledger = dir / "ledger.yaml";
  {
    std::ofstream out(ledger);
    out << "currency: GBP\n"
        << "main_balance: 1000\n"
        << "pots:\n"
        << "  - { id: a, name: First, target: 600, priority: 1 }\n"
        << "  - { id: b, name: Second, target: 600, priority: 2 }\n";
  }

  const std::string yaml = "schedule:\n  file:\n    path: \"" + (dir / "schedule.json").string() + "\"\n" +
                           "gateway:\n  ledger:\n    path: \"" + ledger.string() + "\"\n";

  {
    auto runtime = waterfall::factory::BuildRuntime(ConfigLoader::LoadFromYamlString(yaml));
    auto result  = runtime.orchestrator->Run(ParseDate("2026-01-30"));
    assert(result.outcome == RunOutcome::kExecuted);
    assert(result.transferred == 1000);
  }

  // a new process sees both the advanced schedule and the moved money
  auto runtime = waterfall::factory::BuildRuntime(ConfigLoader::LoadFromYamlString(yaml));
  auto status  = runtime.orchestrator->Status(ParseDate("2026-01-30"));
  assert(status.persisted);
  assert(!status.due);
  assert(FormatDate(status.schedule.next_payment_date) == "2026-02-27");

  auto accounts = runtime.orchestrator->ReadAccounts(ParseDate("2026-01-30"));
  assert(accounts.main.balance == 0);
  assert(accounts.pots[0].balance == 600);
  assert(accounts.pots[1].balance == 400);
}

void TestSqliteStore() {
  const auto dir  = FreshDir("sqlite");
  const auto yaml = "schedule:\n  sqlite:\n    path: \"" + (dir / "schedule.db").string() + "\"\n" + "gateway:\n  sandbox:\n    main_balance: 0\n";

#if WATERFALL_DB_SQLITE
  auto runtime = waterfall::factory::BuildRuntime(ConfigLoader::LoadFromYamlString(yaml));
  auto result  = runtime.orchestrator->Run(ParseDate("2026-01-12"));
  assert(result.outcome == RunOutcome::kNotDue);
  assert(runtime.orchestrator->Status(ParseDate("2026-01-12")).persisted);
#else
  bool threw = false;
  try {
    (void)waterfall::factory::BuildRuntime(ConfigLoader::LoadFromYamlString(yaml));
  } catch (const waterfall::util::ConfigError&) {
    threw = true;
  }
  assert(threw);
#endif
}

} // namespace

int main() {
  TestSandboxWithFileStore();
  TestLedgerGatewayPersistsAcrossRuntimes();
  TestSqliteStore();

  std::cout << "waterfall_integration_factory: pass\n";
  return 0;
}
