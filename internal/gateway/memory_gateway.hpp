#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "banking_gateway.hpp"

namespace waterfall::gateway {

/*
  In-memory bank. Backs the sandbox configuration and the tests.

  Failures can be scripted per pot (refused transfers) or for reads.
*/
class MemoryGateway final : public BankingGateway {
 public:
  MemoryGateway(util::Amount main_balance, std::vector<model::Pot> pots);

  util::Amount             GetMainBalance() override;
  std::vector<model::Pot>  ListPots() override;
  TransferStatus           TransferToPot(const std::string& pot_id, util::Amount amount) override;

  void FailTransfersTo(const std::string& pot_id, std::string reason);
  void FailReads(std::string reason);
  void ClearFailures();

  void SetMainBalance(util::Amount balance);

  util::Amount PotBalance(const std::string& pot_id) const;

  // Successful transfers in call order.
  std::vector<std::pair<std::string, util::Amount>> Transfers() const;

  // Every TransferToPot call, refused ones included.
  std::size_t TransferAttempts() const;

 private:
  mutable std::mutex                           mutex_;
  util::Amount                                 main_balance_;
  std::vector<model::Pot>                      pots_;
  std::unordered_map<std::string, std::string> failing_pots_;
  std::optional<std::string>                   read_failure_;

  std::vector<std::pair<std::string, util::Amount>> transfers_;
  std::size_t                                       attempts_ = 0;
};

} // namespace waterfall::gateway
