#pragma once

#include <string>

#include "config/config.pb.h"

namespace hivestate::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected so typos surface at startup.
*/
class ConfigLoader {
 public:
  static hivestate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static hivestate::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace hivestate::config
