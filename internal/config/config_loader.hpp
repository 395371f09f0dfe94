#pragma once

#include <string>

#include <yaml-cpp/yaml.h>

#include "config/config.pb.h"

namespace transcription::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Provider credentials may be supplied through the environment
  (ELEVENLABS_API_KEY, GOOGLE_API_KEY), which wins over the file.
*/
class ConfigLoader {
 public:
  static transcription::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static transcription::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyEnvironmentOverrides(transcription::runtime::config::RuntimeConfig& config);

  // throws std::invalid_argument on inconsistent settings
  static void Validate(const transcription::runtime::config::RuntimeConfig& config);

 private:
  static transcription::runtime::config::RuntimeConfig FromNode(const YAML::Node& yaml);
};

} // namespace transcription::config
