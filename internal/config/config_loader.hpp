#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace waterfall::config {

inline constexpr std::uint32_t kDefaultGatewayTimeoutMs = 10000;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, then defaults are filled
  in and the result is validated. Every failure surfaces as util::ConfigError.

  WATERFALL_STATE_PATH, when set, replaces the schedule store path.
*/
class ConfigLoader {
 public:
  static waterfall::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static waterfall::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

void ApplyDefaults(waterfall::runtime::config::RuntimeConfig* config);

// Throws util::ConfigError describing the first problem found.
void ValidateConfig(const waterfall::runtime::config::RuntimeConfig& config);

} // namespace waterfall::config
