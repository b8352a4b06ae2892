#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/gateway/ledger_gateway.hpp"
#include "internal/util/errors.hpp"

namespace {

using waterfall::gateway::LedgerGateway;

std::filesystem::path WriteLedger(const std::string& test_name, const std::string& yaml) {
  const auto dir = std::filesystem::temp_directory_path() / "waterfall_ledger_gateway_tests";
  std::filesystem::create_directories(dir);

  const auto    path = dir / (test_name + ".yaml");
  std::ofstream out(path);
  out << yaml;
  out.close();
  return path;
}

constexpr const char* kLedger = R"(currency: GBP
main_balance: 100000
pots:
  - id: "42"
    name: Emergency
    balance: 0
    target: 50000
    priority: 1
  - id: holiday
    balance: 2500
    target: 30000
    priority: 2
)";

void TestReadsBalances() {
  LedgerGateway gateway(WriteLedger("reads", kLedger));

  assert(gateway.GetMainBalance() == 100000);

  auto pots = gateway.ListPots();
  assert(pots.size() == 2);
  assert(pots[0].id == "42");
  assert(pots[0].name == "Emergency");
  assert(pots[0].target == 50000);
  // missing name falls back to the id
  assert(pots[1].name == "holiday");
  assert(pots[1].balance == 2500);
}

void TestTransferMovesMoneyAndPersists() {
  const auto path = WriteLedger("transfer", kLedger);
  {
    LedgerGateway gateway(path);
    auto          status = gateway.TransferToPot("holiday", 27500);
    assert(status);
    assert(gateway.GetMainBalance() == 72500);
  }

  // a fresh gateway sees the rewritten file
  LedgerGateway reopened(path);
  assert(reopened.GetMainBalance() == 72500);
  auto pots = reopened.ListPots();
  assert(pots[1].balance == 30000);
  assert(pots[0].balance == 0);
}

void TestRefusals() {
  LedgerGateway gateway(WriteLedger("refusals", kLedger));

  auto unknown = gateway.TransferToPot("missing", 100);
  assert(!unknown);
  assert(unknown.reason.find("unknown pot") != std::string::npos);

  assert(!gateway.TransferToPot("42", 0));
  assert(!gateway.TransferToPot("42", -10));
  assert(!gateway.TransferToPot("42", 100001));

  // nothing moved
  assert(gateway.GetMainBalance() == 100000);
}

void TestUnreadableLedgerIsGatewayError() {
  LedgerGateway gateway("/nonexistent/waterfall/ledger.yaml");

  bool threw = false;
  try {
    (void)gateway.GetMainBalance();
  } catch (const waterfall::util::GatewayError& e) {
    threw = !e.Timeout();
  }
  assert(threw);

  LedgerGateway malformed(WriteLedger("malformed", "main_balance: 10\nbogus: 1\n"));
  threw = false;
  try {
    (void)malformed.ListPots();
  } catch (const waterfall::util::GatewayError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestReadsBalances();
  TestTransferMovesMoneyAndPersists();
  TestRefusals();
  TestUnreadableLedgerIsGatewayError();

  std::cout << "waterfall_unit_ledger_gateway: pass\n";
  return 0;
}
