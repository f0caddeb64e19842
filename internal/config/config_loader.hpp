#pragma once

#include <string>

#include "config/config.pb.h"

namespace freight::config {

/*
  Loads RuntimeConfig from YAML.

  The YAML tree is converted to a protobuf Struct, rendered as JSON and
  parsed into RuntimeConfig. Unknown keys are rejected so that a typo in
  a tuning knob fails startup instead of silently using the default.
*/
class ConfigLoader {
 public:
  static freight::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static freight::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace freight::config
