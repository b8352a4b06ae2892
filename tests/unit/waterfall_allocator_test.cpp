#include <algorithm>
#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "internal/allocation/waterfall_allocator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using waterfall::allocation::Allocate;
using waterfall::allocation::TotalNeed;
using waterfall::model::Pot;
using waterfall::util::Amount;

const waterfall::util::Date kPayday = waterfall::util::ParseDate("2026-02-26");

std::vector<Pot> TwoPots() {
  return {
      Pot{"A", "Emergency", 0, 500, 1},
      Pot{"B", "Holiday", 0, 300, 2},
  };
}

bool RejectsPots(std::vector<Pot> pots) {
  try {
    (void)Allocate(100, std::move(pots), kPayday);
  } catch (const waterfall::util::ConfigError&) {
    return true;
  }
  return false;
}

void TestFillsInPriorityOrder() {
  auto plan = Allocate(700, TwoPots(), kPayday);

  assert(plan.entries.size() == 2);
  assert(plan.entries[0].pot_id == "A" && plan.entries[0].amount == 500);
  assert(plan.entries[1].pot_id == "B" && plan.entries[1].amount == 200);
  assert(plan.Total() == 700);
  assert(plan.Remaining() == 0);
  assert(plan.payday == kPayday);
}

void TestShortfallLeavesExplicitZero() {
  auto plan = Allocate(200, TwoPots(), kPayday);

  assert(plan.entries.size() == 2);
  assert(plan.entries[0].amount == 200);
  assert(plan.entries[1].pot_id == "B");
  assert(plan.entries[1].amount == 0);
  assert(plan.entries[1].need == 300);
  assert(plan.NonZeroEntries().size() == 1);
}

void TestSurplusStaysInMain() {
  auto plan = Allocate(10000, TwoPots(), kPayday);
  assert(plan.Total() == 800);
  assert(plan.Remaining() == 9200);
}

void TestInputOrderDoesNotMatter() {
  std::vector<Pot> reversed = {
      Pot{"B", "Holiday", 0, 300, 2},
      Pot{"A", "Emergency", 0, 500, 1},
  };
  auto plan = Allocate(700, reversed, kPayday);
  assert(plan.entries[0].pot_id == "A");
  assert(plan.entries[1].pot_id == "B");
}

void TestFundedAndOverfundedPotsGetNothing() {
  std::vector<Pot> pots = {
      Pot{"full", "Full", 500, 500, 1},
      Pot{"over", "Over", 900, 100, 2},
      Pot{"short", "Short", 50, 150, 3},
  };
  auto plan = Allocate(1000, pots, kPayday);

  assert(plan.entries[0].amount == 0);
  assert(plan.entries[1].amount == 0);
  assert(plan.entries[1].need == 0);
  assert(plan.entries[2].amount == 100);
}

void TestZeroAvailable() {
  auto plan = Allocate(0, TwoPots(), kPayday);
  assert(plan.Total() == 0);
  assert(plan.entries.size() == 2);
  assert(plan.NonZeroEntries().empty());

  auto empty = Allocate(500, {}, kPayday);
  assert(empty.entries.empty());
  assert(empty.Remaining() == 500);
}

void TestInvalidInputIsRejected() {
  assert(RejectsPots({Pot{"A", "a", 0, 1, 1}, Pot{"B", "b", 0, 1, 1}}));
  assert(RejectsPots({Pot{"A", "a", 0, 1, 1}, Pot{"A", "b", 0, 1, 2}}));
  assert(RejectsPots({Pot{"A", "a", 0, -1, 1}}));
  assert(RejectsPots({Pot{"A", "a", -5, 10, 1}}));
  assert(RejectsPots({Pot{"", "a", 0, 10, 1}}));

  bool threw = false;
  try {
    (void)Allocate(-1, TwoPots(), kPayday);
  } catch (const waterfall::util::ConfigError&) {
    threw = true;
  }
  assert(threw && "negative available must be rejected");
}

void TestPropertiesOverRandomInputs() {
  std::mt19937_64                      rng(20260226);
  std::uniform_int_distribution<Amount> money(0, 50000);
  std::uniform_int_distribution<int>    count(0, 8);

  for (int round = 0; round < 500; ++round) {
    std::vector<Pot> pots;
    const int        n = count(rng);
    for (int i = 0; i < n; ++i) {
      pots.push_back(Pot{"pot-" + std::to_string(i), "", money(rng), money(rng), (i * 7) % 11 - 5});
    }
    const Amount available = money(rng);

    auto plan = Allocate(available, pots, kPayday);
    assert(plan.Total() <= available);
    assert(plan.Total() == std::min(available, TotalNeed(pots)));

    for (std::size_t i = 0; i < plan.entries.size(); ++i) {
      assert(plan.entries[i].amount >= 0);
      assert(plan.entries[i].amount <= plan.entries[i].need);
      // a later pot only receives money once every earlier pot is full
      if (i > 0 && plan.entries[i].amount > 0) {
        assert(plan.entries[i - 1].amount == plan.entries[i - 1].need);
      }
    }

    auto again = Allocate(available, pots, kPayday);
    assert(again.entries.size() == plan.entries.size());
    for (std::size_t i = 0; i < plan.entries.size(); ++i) {
      assert(again.entries[i].pot_id == plan.entries[i].pot_id);
      assert(again.entries[i].amount == plan.entries[i].amount);
    }
  }
}

} // namespace

int main() {
  TestFillsInPriorityOrder();
  TestShortfallLeavesExplicitZero();
  TestSurplusStaysInMain();
  TestInputOrderDoesNotMatter();
  TestFundedAndOverfundedPotsGetNothing();
  TestZeroAvailable();
  TestInvalidInputIsRejected();
  TestPropertiesOverRandomInputs();

  std::cout << "waterfall_unit_waterfall_allocator: pass\n";
  return 0;
}
