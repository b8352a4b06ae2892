#pragma once

#include <filesystem>

#include "banking_gateway.hpp"
#include "waterfall/v1/ledger.pb.h"

namespace waterfall::gateway {

/*
  Bank backed by a ledger file (waterfall.v1.Ledger, YAML or JSON).

  The file is re-read on every call. Each accepted transfer moves the amount
  from main_balance to the pot and rewrites the file atomically, as JSON.
  Unknown pots, non-positive amounts and overdrawing transfers are refused.
*/
class LedgerGateway final : public BankingGateway {
 public:
  explicit LedgerGateway(std::filesystem::path path);

  util::Amount            GetMainBalance() override;
  std::vector<model::Pot> ListPots() override;
  TransferStatus          TransferToPot(const std::string& pot_id, util::Amount amount) override;

 private:
  waterfall::v1::Ledger Read() const;
  void                  Write(const waterfall::v1::Ledger& ledger) const;

  std::filesystem::path path_;
};

} // namespace waterfall::gateway
