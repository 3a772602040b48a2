#pragma once

#include <string>

#include "config/config.pb.h"

namespace offline::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected, then the result is validated.
*/
class ConfigLoader {
 public:
  static offline::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // In-memory storage, in-memory key, built-in defaults everywhere else.
  static offline::runtime::config::RuntimeConfig Defaults();

  // Throws std::runtime_error describing the first invalid setting.
  static void Validate(const offline::runtime::config::RuntimeConfig& config);
};

} // namespace offline::config
