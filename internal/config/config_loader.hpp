#pragma once

#include <string>

#include "config/config.pb.h"

namespace sitely::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Unset sqlite tuning fields receive their defaults and a missing
  database path is an error.
*/
class ConfigLoader {
 public:
  static sitely::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(sitely::runtime::config::RuntimeConfig& config);
};

} // namespace sitely::config
