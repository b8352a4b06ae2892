#include "waterfall_allocator.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace waterfall::allocation {

using waterfall::util::ConfigError;

void ValidatePots(const std::vector<model::Pot>& pots) {
  std::unordered_set<std::string>                   ids;
  std::unordered_map<std::int32_t, const model::Pot*> priorities;

  for (const auto& pot : pots) {
    if (pot.id.empty()) {
      throw ConfigError("pot '" + pot.name + "' has an empty id");
    }
    if (!ids.insert(pot.id).second) {
      throw ConfigError("duplicate pot id '" + pot.id + "'");
    }
    if (pot.target < 0) {
      throw ConfigError("pot '" + pot.id + "' has a negative target");
    }
    if (pot.balance < 0) {
      throw ConfigError("pot '" + pot.id + "' has a negative balance");
    }

    auto [it, inserted] = priorities.emplace(pot.priority, &pot);
    if (!inserted) {
      throw ConfigError("pots '" + it->second->id + "' and '" + pot.id + "' share priority " + std::to_string(pot.priority));
    }
  }
}

void SortByPriority(std::vector<model::Pot>* pots) {
  std::sort(pots->begin(), pots->end(), [](const model::Pot& a, const model::Pot& b) { return a.priority < b.priority; });
}

util::Amount TotalNeed(const std::vector<model::Pot>& pots) {
  util::Amount total = 0;
  for (const auto& pot : pots) {
    total += pot.Need();
  }
  return total;
}

model::TransferPlan Allocate(util::Amount available, std::vector<model::Pot> pots, util::Date payday) {
  if (available < 0) {
    throw ConfigError("available amount must not be negative");
  }
  ValidatePots(pots);
  SortByPriority(&pots);

  model::TransferPlan plan;
  plan.payday    = payday;
  plan.available = available;
  plan.entries.reserve(pots.size());

  util::Amount remaining = available;
  for (const auto& pot : pots) {
    const util::Amount need   = pot.Need();
    const util::Amount amount = std::min(need, remaining);
    remaining -= amount;

    plan.entries.push_back(model::PlanEntry{pot.id, pot.name, need, amount});
  }

  return plan;
}

} // namespace waterfall::allocation
