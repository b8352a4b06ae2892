#include "config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <vector>

#include "internal/allocation/waterfall_allocator.hpp"
#include "internal/config/yaml_proto.hpp"
#include "internal/model/pot.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace waterfall::config {

using waterfall::runtime::config::RuntimeConfig;
using waterfall::util::ConfigError;

namespace {

void ApplyEnvironment(RuntimeConfig* config) {
  const char* state_path = std::getenv("WATERFALL_STATE_PATH");
  if (state_path == nullptr || *state_path == '\0') {
    return;
  }

  auto* schedule = config->mutable_schedule();
  if (schedule->has_sqlite()) {
    schedule->mutable_sqlite()->set_path(state_path);
  } else if (!schedule->has_memory()) {
    schedule->mutable_file()->set_path(state_path);
  }
}

RuntimeConfig Finish(RuntimeConfig config) {
  ApplyEnvironment(&config);
  ApplyDefaults(&config);
  ValidateConfig(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  RuntimeConfig config;
  try {
    LoadYamlFile(path, &config);
  } catch (const std::exception& e) {
    throw ConfigError("Invalid configuration: " + std::string(e.what()));
  }
  return Finish(std::move(config));
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  RuntimeConfig config;
  try {
    YamlToMessage(YAML::Load(yaml), &config);
  } catch (const std::exception& e) {
    throw ConfigError("Invalid configuration: " + std::string(e.what()));
  }
  return Finish(std::move(config));
}

void ApplyDefaults(RuntimeConfig* config) {
  if (config->allocation().currency().empty()) {
    config->mutable_allocation()->set_currency(std::string(util::kDefaultCurrency));
  }
  if (config->gateway().timeout_ms() == 0) {
    config->mutable_gateway()->set_timeout_ms(kDefaultGatewayTimeoutMs);
  }
}

void ValidateConfig(const RuntimeConfig& config) {
  const auto& schedule = config.schedule();
  switch (schedule.store_case()) {
    case waterfall::runtime::config::ScheduleConfig::kFile:
      if (schedule.file().path().empty()) throw ConfigError("schedule.file.path must not be empty");
      break;
    case waterfall::runtime::config::ScheduleConfig::kSqlite:
      if (schedule.sqlite().path().empty()) throw ConfigError("schedule.sqlite.path must not be empty");
      break;
    case waterfall::runtime::config::ScheduleConfig::kMemory:
      break;
    default:
      throw ConfigError("schedule store must be one of: file, sqlite, memory");
  }

  if (config.allocation().reserve() < 0) {
    throw ConfigError("allocation.reserve must not be negative");
  }

  for (const auto& holiday : config.calendar().holidays()) {
    try {
      (void)util::ParseDate(holiday);
    } catch (const std::invalid_argument& e) {
      throw ConfigError("calendar.holidays: " + std::string(e.what()));
    }
  }

  const auto& gateway = config.gateway();
  switch (gateway.backend_case()) {
    case waterfall::runtime::config::GatewayConfig::kLedger:
      if (gateway.ledger().path().empty()) throw ConfigError("gateway.ledger.path must not be empty");
      break;
    case waterfall::runtime::config::GatewayConfig::kSandbox: {
      if (gateway.sandbox().main_balance() < 0) throw ConfigError("gateway.sandbox.main_balance must not be negative");
      std::vector<model::Pot> pots;
      for (const auto& pot : gateway.sandbox().pots()) {
        pots.push_back(model::Pot{pot.id(), pot.name(), pot.balance(), pot.target(), pot.priority()});
      }
      allocation::ValidatePots(pots);
      break;
    }
    default:
      throw ConfigError("gateway backend must be one of: ledger, sandbox");
  }
}

} // namespace waterfall::config
