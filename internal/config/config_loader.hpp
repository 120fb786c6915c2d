#pragma once

#include <string>

#include "config/config.pb.h"

namespace dispatcher::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset fields get defaults, then the result is validated.
  All failures throw std::runtime_error.
*/
class ConfigLoader {
 public:
  static dispatcher::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static dispatcher::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Used when no config file is given.
  static dispatcher::runtime::config::RuntimeConfig Defaults();

 private:
  static void ApplyDefaults(dispatcher::runtime::config::RuntimeConfig& config);
  static void Validate(const dispatcher::runtime::config::RuntimeConfig& config);
};

} // namespace dispatcher::config
