#pragma once

#include <string>

#include "config/config.pb.h"

namespace apparatus::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the
  .proto schema is the single source of truth for valid keys.
*/
class ConfigLoader {
 public:
  static apparatus::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static apparatus::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace apparatus::config
