#pragma once

#include <string>

#include "config/config.pb.h"

namespace blockforge::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, serialized to JSON and parsed into
  RuntimeConfig with unknown fields rejected. Fields left at zero or empty
  are then filled with the built-in defaults.
*/
class ConfigLoader {
 public:
  static blockforge::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static blockforge::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(blockforge::runtime::config::RuntimeConfig* config);
};

} // namespace blockforge::config
