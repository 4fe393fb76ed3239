#pragma once

#include <string>

#include "config/config.pb.h"

namespace ledger::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  are rejected with the same rules as the protobuf JSON parser.
*/
class ConfigLoader {
 public:
  static ledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static ledger::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace ledger::config
