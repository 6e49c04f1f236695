#pragma once

#include <string>

#include "config/config.pb.h"

namespace runlens::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Missing sections fall back to built-in defaults (memory
  database, default thresholds, ".fit" files).
*/
class ConfigLoader {
 public:
  static runlens::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static runlens::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  // Configuration used when no file is given.
  static runlens::runtime::config::RuntimeConfig Defaults();
};

// Defaults applied to the ingest section.
inline constexpr const char* kDefaultActivityExtension = ".fit";
inline constexpr double      kDefaultZone2FloorBpm     = 130.0;

std::string ActivityExtension(const runlens::runtime::config::RuntimeConfig& config);
double      Zone2FloorBpm(const runlens::runtime::config::RuntimeConfig& config);

} // namespace runlens::config
