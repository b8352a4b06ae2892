#include "ledger_gateway.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/config/yaml_proto.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/atomic_file.hpp"
#include "internal/util/errors.hpp"

namespace waterfall::gateway {

using waterfall::observability::AmountField;
using waterfall::observability::StringField;

LedgerGateway::LedgerGateway(std::filesystem::path path) : path_(std::move(path)) {
}

util::Amount LedgerGateway::GetMainBalance() {
  return Read().main_balance();
}

std::vector<model::Pot> LedgerGateway::ListPots() {
  const auto ledger = Read();

  std::vector<model::Pot> pots;
  pots.reserve(ledger.pots_size());
  for (const auto& pot : ledger.pots()) {
    pots.push_back(model::Pot{pot.id(), pot.name().empty() ? pot.id() : pot.name(), pot.balance(), pot.target(), pot.priority()});
  }
  return pots;
}

TransferStatus LedgerGateway::TransferToPot(const std::string& pot_id, util::Amount amount) {
  auto ledger = Read();

  if (amount <= 0) {
    return TransferStatus::Failed("transfer amount must be positive");
  }
  if (amount > ledger.main_balance()) {
    return TransferStatus::Failed("insufficient funds in main account");
  }

  waterfall::v1::LedgerPot* target = nullptr;
  for (auto& pot : *ledger.mutable_pots()) {
    if (pot.id() == pot_id) {
      target = &pot;
      break;
    }
  }
  if (target == nullptr) {
    return TransferStatus::Failed("unknown pot " + pot_id);
  }

  ledger.set_main_balance(ledger.main_balance() - amount);
  target->set_balance(target->balance() + amount);
  Write(ledger);

  WATERFALL_LOG_DEBUG("Ledger transfer applied", {StringField("pot", pot_id), AmountField("amount", amount), StringField("ledger", path_.string())});
  return TransferStatus::Ok();
}

waterfall::v1::Ledger LedgerGateway::Read() const {
  waterfall::v1::Ledger ledger;
  try {
    waterfall::config::LoadYamlFile(path_.string(), &ledger);
  } catch (const std::exception& e) {
    throw util::GatewayError("ledger read failed: " + std::string(e.what()));
  }
  return ledger;
}

void LedgerGateway::Write(const waterfall::v1::Ledger& ledger) const {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ledger, &json, options);
  if (!status.ok()) {
    throw util::GatewayError("ledger serialize failed: " + std::string(status.message()));
  }

  try {
    util::WriteFileAtomically(path_, json);
  } catch (const std::exception& e) {
    throw util::GatewayError("ledger write failed: " + std::string(e.what()));
  }
}

} // namespace waterfall::gateway
