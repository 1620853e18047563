#pragma once

#include <string>

#include "config/config.pb.h"

namespace gearledger::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields left unset in
  the file fall back to the values from Defaults().
*/
class ConfigLoader {
 public:
  static gearledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static gearledger::runtime::config::RuntimeConfig Defaults();

  // Fills every zero/empty field with its default value.
  static void ApplyDefaults(gearledger::runtime::config::RuntimeConfig* config);
};

} // namespace gearledger::config
