#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/gateway/deadline_gateway.hpp"
#include "internal/gateway/memory_gateway.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using waterfall::gateway::BankingGateway;
using waterfall::gateway::DeadlineGateway;
using waterfall::gateway::TransferStatus;

// Bank that answers after a fixed delay.
class SlowGateway final : public BankingGateway {
 public:
  explicit SlowGateway(std::chrono::milliseconds delay) : delay_(delay) {
  }

  waterfall::util::Amount GetMainBalance() override {
    std::this_thread::sleep_for(delay_);
    return 1000;
  }

  std::vector<waterfall::model::Pot> ListPots() override {
    std::this_thread::sleep_for(delay_);
    return {};
  }

  TransferStatus TransferToPot(const std::string&, waterfall::util::Amount) override {
    std::this_thread::sleep_for(delay_);
    completed_transfers.fetch_add(1);
    return TransferStatus::Ok();
  }

  std::atomic<int> completed_transfers{0};

 private:
  std::chrono::milliseconds delay_;
};

// Bank that records how many transfers are inside it at once.
class TrackingGateway final : public BankingGateway {
 public:
  waterfall::util::Amount GetMainBalance() override {
    return 1000;
  }

  std::vector<waterfall::model::Pot> ListPots() override {
    return {};
  }

  TransferStatus TransferToPot(const std::string& pot_id, waterfall::util::Amount) override {
    const int now_active = active.fetch_add(1) + 1;
    int       seen       = max_active.load();
    while (now_active > seen && !max_active.compare_exchange_weak(seen, now_active)) {
    }
    std::this_thread::sleep_for(pot_id == "slow" ? 300ms : 20ms);
    completed.fetch_add(1);
    active.fetch_sub(1);
    return TransferStatus::Ok();
  }

  std::atomic<int> active{0};
  std::atomic<int> max_active{0};
  std::atomic<int> completed{0};
};

// Bank whose client library throws something other than GatewayError.
class BrokenGateway final : public BankingGateway {
 public:
  waterfall::util::Amount GetMainBalance() override {
    throw std::logic_error("socket closed");
  }
  std::vector<waterfall::model::Pot> ListPots() override {
    throw waterfall::util::GatewayError("401 unauthorized");
  }
  TransferStatus TransferToPot(const std::string&, waterfall::util::Amount) override {
    throw std::runtime_error("connection reset");
  }
};

void TestFastCallsPassThrough() {
  auto inner = std::make_shared<waterfall::gateway::MemoryGateway>(5000, std::vector<waterfall::model::Pot>{{"a", "A", 0, 100, 1}});
  DeadlineGateway gateway(inner, 1000ms);

  assert(gateway.GetMainBalance() == 5000);
  assert(gateway.ListPots().size() == 1);
  assert(gateway.TransferToPot("a", 100));
  assert(!gateway.TransferToPot("b", 100));
  assert(inner->PotBalance("a") == 100);
}

void TestTimeoutIsGatewayError() {
  auto            slow = std::make_shared<SlowGateway>(400ms);
  DeadlineGateway gateway(slow, 50ms);

  const auto started = std::chrono::steady_clock::now();
  bool       timed_out = false;
  try {
    (void)gateway.GetMainBalance();
  } catch (const waterfall::util::GatewayError& e) {
    timed_out = e.Timeout();
  }
  assert(timed_out);
  assert(std::chrono::steady_clock::now() - started < 350ms);

  // a timed-out transfer is never reported as a success
  bool transfer_failed = false;
  try {
    (void)gateway.TransferToPot("a", 1);
  } catch (const waterfall::util::GatewayError& e) {
    transfer_failed = e.Timeout();
  }
  assert(transfer_failed);

  // the abandoned call still runs to completion against a live gateway
  gateway.AwaitIdle();
  assert(slow->completed_transfers.load() == 1);
}

void TestErrorsAreGatewayErrors() {
  DeadlineGateway gateway(std::make_shared<BrokenGateway>(), 1000ms);

  bool wrapped = false;
  try {
    (void)gateway.GetMainBalance();
  } catch (const waterfall::util::GatewayError& e) {
    wrapped = !e.Timeout() && std::string(e.what()).find("socket closed") != std::string::npos;
  }
  assert(wrapped);

  bool passed_through = false;
  try {
    (void)gateway.ListPots();
  } catch (const waterfall::util::GatewayError& e) {
    passed_through = std::string(e.what()) == "401 unauthorized";
  }
  assert(passed_through);

  bool transfer_wrapped = false;
  try {
    (void)gateway.TransferToPot("a", 1);
  } catch (const waterfall::util::GatewayError&) {
    transfer_wrapped = true;
  }
  assert(transfer_wrapped);
}

void TestTimedOutCallNeverOverlapsTheNext() {
  auto            bank = std::make_shared<TrackingGateway>();
  DeadlineGateway gateway(bank, 100ms);

  bool timed_out = false;
  try {
    (void)gateway.TransferToPot("slow", 1);
  } catch (const waterfall::util::GatewayError& e) {
    timed_out = e.Timeout();
  }
  assert(timed_out);
  assert(bank->active.load() == 1);

  // the next call waits for the abandoned one before reaching the bank
  assert(gateway.TransferToPot("fast", 1));
  assert(bank->completed.load() == 2);
  assert(bank->max_active.load() == 1);
}

void TestAwaitIdleJoinsAbandonedCall() {
  auto            bank = std::make_shared<TrackingGateway>();
  DeadlineGateway gateway(bank, 50ms);

  try {
    (void)gateway.TransferToPot("slow", 1);
    assert(false);
  } catch (const waterfall::util::GatewayError&) {
  }

  gateway.AwaitIdle();
  assert(bank->active.load() == 0);
  assert(bank->completed.load() == 1);
}

void TestDestructorJoinsAbandonedCall() {
  auto bank = std::make_shared<TrackingGateway>();
  {
    DeadlineGateway gateway(bank, 50ms);
    try {
      (void)gateway.TransferToPot("slow", 1);
      assert(false);
    } catch (const waterfall::util::GatewayError&) {
    }
  }
  assert(bank->active.load() == 0);
  assert(bank->completed.load() == 1);
}

} // namespace

int main() {
  TestFastCallsPassThrough();
  TestTimeoutIsGatewayError();
  TestErrorsAreGatewayErrors();
  TestTimedOutCallNeverOverlapsTheNext();
  TestAwaitIdleJoinsAbandonedCall();
  TestDestructorJoinsAbandonedCall();

  std::cout << "waterfall_unit_deadline_gateway: pass\n";
  return 0;
}
