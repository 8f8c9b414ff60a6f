#pragma once

#include <string>

#include "config/config.pb.h"

namespace chronicle::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Environment
  overrides are applied afterwards:

    CHRONICLE_CONN  replaces database.postgres.connection_uri
*/
class ConfigLoader {
 public:
  static chronicle::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static chronicle::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace chronicle::config
