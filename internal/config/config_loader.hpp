#pragma once

#include <string>

#include "config/config.pb.h"

namespace relay::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected; unset sections receive defaults.
*/
class ConfigLoader {
 public:
  static relay::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(relay::runtime::config::RuntimeConfig& config);
};

} // namespace relay::config
