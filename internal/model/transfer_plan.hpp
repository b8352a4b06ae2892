#pragma once

#include <string>
#include <vector>

#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace waterfall::model {

struct PlanEntry {
  std::string  pot_id;
  std::string  pot_name;
  util::Amount need   = 0;
  util::Amount amount = 0;
};

/*
  Result of one waterfall allocation. Entries are in priority order and every
  pot of the input appears exactly once, including zero-amount entries.
*/
struct TransferPlan {
  util::Date             payday{};
  util::Amount           available = 0;
  std::vector<PlanEntry> entries;

  util::Amount Total() const {
    util::Amount total = 0;
    for (const auto& entry : entries) {
      total += entry.amount;
    }
    return total;
  }

  util::Amount Remaining() const {
    return available - Total();
  }

  std::vector<PlanEntry> NonZeroEntries() const {
    std::vector<PlanEntry> out;
    for (const auto& entry : entries) {
      if (entry.amount > 0) out.push_back(entry);
    }
    return out;
  }
};

} // namespace waterfall::model
