#pragma once

#include <string>

#include "config/config.pb.h"

namespace settle::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. LoadFromYaml applies environment overrides and defaults before
  returning.
*/
class ConfigLoader {
 public:
  static settle::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // SETTLE_DATABASE_URL replaces the database section:
  //   sqlite:<path>
  //   postgres://... or postgresql://...
  static void ApplyEnvironmentOverrides(settle::runtime::config::RuntimeConfig& config);

  // Parses a database URL into the database section. Throws std::invalid_argument.
  static void ApplyDatabaseUrl(const std::string& url, settle::runtime::config::RuntimeConfig& config);
};

} // namespace settle::config
