#pragma once

#include <vector>

#include "internal/model/pot.hpp"
#include "internal/model/transfer_plan.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace waterfall::allocation {

/*
  Greedy single-pass waterfall.

  Pots are visited in ascending priority. Each receives
      min(max(0, target - balance), remaining)
  and remaining is decremented. Every pot gets an entry, zero or not.

  Invariants of the returned plan:
    - Total() <= available
    - entry.amount <= pot.Need()
    - Total() == min(available, TotalNeed(pots))
*/

// Throws util::ConfigError on duplicate ids, tied priorities, or negative
// target/balance.
void ValidatePots(const std::vector<model::Pot>& pots);

// Validates first; throws util::ConfigError if available is negative.
model::TransferPlan Allocate(util::Amount available, std::vector<model::Pot> pots, util::Date payday);

util::Amount TotalNeed(const std::vector<model::Pot>& pots);

// Ascending priority; does not validate.
void SortByPriority(std::vector<model::Pot>* pots);

} // namespace waterfall::allocation
