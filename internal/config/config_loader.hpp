#pragma once

#include <string>

#include "config/config.pb.h"

namespace healthstore::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static healthstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static healthstore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset fields with the runtime defaults.
  static void ApplyDefaults(healthstore::runtime::config::RuntimeConfig& config);
};

} // namespace healthstore::config
