#pragma once

#include <string>

#include "config/config.pb.h"

namespace settleup::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so the schema in
  config.proto is the single source of truth for accepted keys.
*/
class ConfigLoader {
 public:
  static settleup::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Built-in values for every field the YAML left empty.
  static void ApplyDefaults(settleup::runtime::config::RuntimeConfig& config);
};

} // namespace settleup::config
