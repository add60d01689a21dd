#pragma once

#include <string>

#include "config/config.pb.h"

namespace taskorch::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so durations
  use the protobuf JSON form ("30s", "1.5s"). Unknown keys are errors.
*/
class ConfigLoader {
 public:
  static taskorch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static taskorch::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace taskorch::config
