#pragma once

#include <string>

#include "config/config.pb.h"

namespace discovery::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset tunables are
  filled with the defaults below, then the result is validated; any problem
  is reported as std::runtime_error naming the offending field.
*/
class ConfigLoader {
 public:
  static discovery::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(discovery::runtime::config::RuntimeConfig* config);

  static void Validate(const discovery::runtime::config::RuntimeConfig& config);
};

} // namespace discovery::config
