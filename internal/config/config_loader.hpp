#pragma once

#include <string>

#include "config/config.pb.h"

namespace callscribe::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected. Unset values are filled from ApplyDefaults().
*/
class ConfigLoader {
 public:
  static callscribe::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static callscribe::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills every zero/empty field that has an operational default.
  static void ApplyDefaults(callscribe::runtime::config::RuntimeConfig& config);

  // Throws std::invalid_argument on values the pipeline cannot run with.
  static void Validate(const callscribe::runtime::config::RuntimeConfig& config);
};

} // namespace callscribe::config
