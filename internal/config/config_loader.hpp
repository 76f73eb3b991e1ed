#pragma once

#include <string>

#include "config/config.pb.h"

namespace booking::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  type mismatches are rejected by the protobuf JSON parser.
*/
class ConfigLoader {
 public:
  static booking::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static booking::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);
};

} // namespace booking::config
