#pragma once

#include <string>

#include "config/config.pb.h"

namespace collab::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Defaults are filled in and the result validated before it is
  returned, so callers can read every field without further checks.
*/
class ConfigLoader {
 public:
  static collab::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static collab::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(collab::runtime::config::RuntimeConfig& config);

  // throws std::runtime_error("Invalid configuration: ...")
  static void Validate(const collab::runtime::config::RuntimeConfig& config);
};

} // namespace collab::config
