#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace registry::config {

// Upper bounds that keep nanosecond and deadline arithmetic from overflowing.
constexpr uint32_t kMaxSubscriptionDays = 36'500;
constexpr uint64_t kMaxLedgerDeadlineMs = 3'600'000;

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected. Quoted scalars always stay strings. Defaults are applied and the
  result validated before it is returned; violations throw
  std::runtime_error.
*/
class ConfigLoader {
 public:
  static registry::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static registry::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(registry::runtime::config::RuntimeConfig& config);
  static void Validate(const registry::runtime::config::RuntimeConfig& config);
};

} // namespace registry::config
