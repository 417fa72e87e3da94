#pragma once

#include <string>

#include "config/config.pb.h"

namespace vera::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Fields left at zero/empty take the documented defaults.
*/
class ConfigLoader {
 public:
  static vera::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static vera::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Built-in configuration used when no file is given.
  static vera::runtime::config::RuntimeConfig Defaults();

  // Fills zero/empty fields with defaults. Idempotent.
  static void ApplyDefaults(vera::runtime::config::RuntimeConfig& config);
};

} // namespace vera::config
