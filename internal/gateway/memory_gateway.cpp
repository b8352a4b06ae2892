#include "memory_gateway.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace waterfall::gateway {

MemoryGateway::MemoryGateway(util::Amount main_balance, std::vector<model::Pot> pots) : main_balance_(main_balance), pots_(std::move(pots)) {
}

util::Amount MemoryGateway::GetMainBalance() {
  std::scoped_lock lock(mutex_);
  if (read_failure_) throw util::GatewayError(*read_failure_);
  return main_balance_;
}

std::vector<model::Pot> MemoryGateway::ListPots() {
  std::scoped_lock lock(mutex_);
  if (read_failure_) throw util::GatewayError(*read_failure_);
  return pots_;
}

TransferStatus MemoryGateway::TransferToPot(const std::string& pot_id, util::Amount amount) {
  std::scoped_lock lock(mutex_);
  ++attempts_;

  if (auto it = failing_pots_.find(pot_id); it != failing_pots_.end()) {
    return TransferStatus::Failed(it->second);
  }

  auto pot = std::find_if(pots_.begin(), pots_.end(), [&](const model::Pot& p) { return p.id == pot_id; });
  if (pot == pots_.end()) {
    return TransferStatus::Failed("unknown pot " + pot_id);
  }
  if (amount <= 0) {
    return TransferStatus::Failed("transfer amount must be positive");
  }
  if (amount > main_balance_) {
    return TransferStatus::Failed("insufficient funds");
  }

  main_balance_ -= amount;
  pot->balance += amount;
  transfers_.emplace_back(pot_id, amount);
  return TransferStatus::Ok();
}

void MemoryGateway::FailTransfersTo(const std::string& pot_id, std::string reason) {
  std::scoped_lock lock(mutex_);
  failing_pots_[pot_id] = std::move(reason);
}

void MemoryGateway::FailReads(std::string reason) {
  std::scoped_lock lock(mutex_);
  read_failure_ = std::move(reason);
}

void MemoryGateway::ClearFailures() {
  std::scoped_lock lock(mutex_);
  failing_pots_.clear();
  read_failure_.reset();
}

void MemoryGateway::SetMainBalance(util::Amount balance) {
  std::scoped_lock lock(mutex_);
  main_balance_ = balance;
}

util::Amount MemoryGateway::PotBalance(const std::string& pot_id) const {
  std::scoped_lock lock(mutex_);
  for (const auto& pot : pots_) {
    if (pot.id == pot_id) return pot.balance;
  }
  return 0;
}

std::vector<std::pair<std::string, util::Amount>> MemoryGateway::Transfers() const {
  std::scoped_lock lock(mutex_);
  return transfers_;
}

std::size_t MemoryGateway::TransferAttempts() const {
  std::scoped_lock lock(mutex_);
  return attempts_;
}

} // namespace waterfall::gateway
