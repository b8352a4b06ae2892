#pragma once

#include <string>
#include <vector>

#include "internal/model/pot.hpp"
#include "internal/util/money.hpp"

namespace waterfall::gateway {

/*
  Outcome of one transfer request as reported by the bank.
*/
struct TransferStatus {
  bool        ok = true;
  std::string reason;

  static TransferStatus Ok() {
    return {};
  }

  static TransferStatus Failed(std::string why) {
    return {false, std::move(why)};
  }

  explicit operator bool() const {
    return ok;
  }
};

/*
  The bank, as far as the engine is concerned.

  Reads throw util::GatewayError on network/auth/timeout failures.
  TransferToPot reports refusals as !ok and may also throw util::GatewayError;
  either way the transfer must be assumed "maybe executed".

  Nothing is cached between calls; every read reflects the bank at that
  moment.
*/
class BankingGateway {
 public:
  virtual ~BankingGateway() = default;

  virtual util::Amount GetMainBalance() = 0;

  virtual std::vector<model::Pot> ListPots() = 0;

  virtual TransferStatus TransferToPot(const std::string& pot_id, util::Amount amount) = 0;

  // Returns once no call issued through this gateway is still running,
  // including calls whose caller already gave up on them.
  virtual void AwaitIdle() {
  }
};

} // namespace waterfall::gateway
