#pragma once

#include <string>

#include "config/config.pb.h"

namespace tierbridge::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Missing engine tunables are filled with defaults and the
  source list is validated before the config is handed out.
*/
class ConfigLoader {
 public:
  static tierbridge::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static tierbridge::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(tierbridge::runtime::config::RuntimeConfig* config);
  static void Validate(const tierbridge::runtime::config::RuntimeConfig& config);
};

} // namespace tierbridge::config
