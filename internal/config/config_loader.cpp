#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace transcription::config {

using transcription::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings ("0123" stays an API key, not a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

static void OverrideFromEnv(const char* name, std::string* target) {
  if (const char* value = std::getenv(name); value && *value) {
    *target = value;
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::FromNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  // an empty document is an all-defaults config
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = FromNode(yaml);
  ApplyEnvironmentOverrides(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = FromNode(yaml);
  ApplyEnvironmentOverrides(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  auto* providers = config.mutable_providers();
  OverrideFromEnv("ELEVENLABS_API_KEY", providers->mutable_elevenlabs()->mutable_api_key());
  OverrideFromEnv("GOOGLE_API_KEY", providers->mutable_google()->mutable_api_key());
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::invalid_argument("Invalid configuration: database.sqlite.path must not be empty");
  }
  if (config.providers().max_segment_length() > 0 && config.providers().max_segment_length() < 16) {
    throw std::invalid_argument("Invalid configuration: providers.max_segment_length must be at least 16");
  }
  if (config.workers().threads() > 64) {
    throw std::invalid_argument("Invalid configuration: workers.threads must not exceed 64");
  }
}

} // namespace transcription::config
