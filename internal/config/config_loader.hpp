#pragma once

#include <string>

#include "config/config.pb.h"

namespace blueshare::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the proto schema is
  the single definition of what a config file may contain.
*/
class ConfigLoader {
 public:
  static blueshare::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static blueshare::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace blueshare::config
