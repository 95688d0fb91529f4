#pragma once

#include <string>

#include "config/config.pb.h"

namespace causal::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Sections left out of the file are filled by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static causal::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // In-memory backend, default cache and index settings.
  static causal::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(causal::runtime::config::RuntimeConfig& config);
};

} // namespace causal::config
