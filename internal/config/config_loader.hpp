#pragma once

#include <string>

#include "config/config.pb.h"

namespace freightline::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Throws std::runtime_error with the offending detail.
*/
class ConfigLoader {
 public:
  static freightline::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static freightline::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace freightline::config
