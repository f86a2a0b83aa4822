#pragma once

#include <string>

#include "config/config.pb.h"

namespace storykb::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset fields are filled with defaults and the result is
  validated before it is returned.
*/
class ConfigLoader {
 public:
  static storykb::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static storykb::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Defaults used when a section or field is absent.
  static void ApplyDefaults(storykb::runtime::config::RuntimeConfig& config);
  static void Validate(const storykb::runtime::config::RuntimeConfig& config);
};

} // namespace storykb::config
