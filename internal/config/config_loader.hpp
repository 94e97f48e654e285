#pragma once

#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace logship::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. String scalars get
  "~" and $VAR / ${VAR} expanded from the environment first. Quoted
  scalars always stay strings. Throws ConfigError.
*/
class ConfigLoader {
 public:
  static logship::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

// Leading "~" becomes $HOME; unknown variables are left as written.
std::string ExpandEnvironment(std::string_view value);

} // namespace logship::config
