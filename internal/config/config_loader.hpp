#pragma once

#include <string>

#include "config/config.pb.h"

namespace activity::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static activity::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion over an in-memory YAML document.
  static activity::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

// Effective history settings with defaults applied.
std::string DefaultBranchName(const activity::runtime::config::RuntimeConfig& config);
uint32_t    SearchPageSize(const activity::runtime::config::RuntimeConfig& config);
uint32_t    HistoryLimit(const activity::runtime::config::RuntimeConfig& config);

} // namespace activity::config
