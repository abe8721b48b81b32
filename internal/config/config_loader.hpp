#pragma once

#include <string>

#include "config/config.pb.h"

namespace localrun::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected so typos in the config surface as errors instead of defaults.
*/
class ConfigLoader {
 public:
  static localrun::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace localrun::config
