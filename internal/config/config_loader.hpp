#pragma once

#include <string>

#include "config/config.pb.h"

namespace vkyc::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Durations are written the protobuf JSON way ("30s", "250ms" is
  not valid, use "0.25s").

  LoadFromYaml applies defaults and validates before returning.
*/
class ConfigLoader {
 public:
  static RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every unset field with its default.
  static void ApplyDefaults(RuntimeConfig& config);

  // Throws util::InvalidArgument naming the first offending field.
  static void Validate(const RuntimeConfig& config);
};

} // namespace vkyc::config
