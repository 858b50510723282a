#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>

#include "internal/executor/code_wrapper.hpp"

namespace blockforge::config {

namespace {

constexpr const char* kDefaultBindAddress      = "0.0.0.0:50051";
constexpr const char* kDefaultPython           = "python3";
constexpr const char* kDefaultArtifactRoot     = "block_artifacts";
constexpr uint32_t    kDefaultTimeoutMs        = 30000;
constexpr uint32_t    kDefaultRetainVersions   = 5;
constexpr uint64_t    kDefaultMaxOutputBytes   = 1024 * 1024;
constexpr const char* kDefaultOracleEndpoint   = "https://api.openai.com/v1/chat/completions";
constexpr const char* kDefaultOracleModel      = "gpt-4";
constexpr const char* kDefaultApiKeyEnv        = "OPENAI_API_KEY";
constexpr double      kDefaultTemperature      = 0.1;
constexpr uint32_t    kDefaultMaxTokens        = 4000;
constexpr uint32_t    kDefaultOracleTimeoutMs  = 120000;
constexpr uint32_t    kDefaultRefreshInterval  = 3600;
constexpr uint32_t    kDefaultHealWindowSec    = 3600;
constexpr uint32_t    kDefaultHealMaxFailures  = 1;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

blockforge::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  blockforge::runtime::config::RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsNull() || !yaml.IsDefined()) {
    ConfigLoader::ApplyDefaults(&config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top-level YAML node must be a mapping");
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

  ConfigLoader::ApplyDefaults(&config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

blockforge::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

blockforge::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(blockforge::runtime::config::RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address(kDefaultBindAddress);
  }

  auto* executor = config->mutable_executor();
  if (executor->python_executable().empty()) executor->set_python_executable(kDefaultPython);
  if (executor->artifact_root().empty()) executor->set_artifact_root(kDefaultArtifactRoot);
  if (executor->timeout_ms() == 0) executor->set_timeout_ms(kDefaultTimeoutMs);
  if (executor->retain_versions() == 0) executor->set_retain_versions(kDefaultRetainVersions);
  if (executor->max_output_bytes() == 0) executor->set_max_output_bytes(kDefaultMaxOutputBytes);
  if (executor->allowed_modules_size() == 0) {
    for (const auto& module : executor::DefaultAllowedModules()) {
      executor->add_allowed_modules(module);
    }
  }

  auto* oracle = config->mutable_oracle();
  if (oracle->endpoint().empty()) oracle->set_endpoint(kDefaultOracleEndpoint);
  if (oracle->model().empty()) oracle->set_model(kDefaultOracleModel);
  if (oracle->api_key_env().empty()) oracle->set_api_key_env(kDefaultApiKeyEnv);
  if (oracle->temperature() == 0.0) oracle->set_temperature(kDefaultTemperature);
  if (oracle->max_tokens() == 0) oracle->set_max_tokens(kDefaultMaxTokens);
  if (oracle->request_timeout_ms() == 0) oracle->set_request_timeout_ms(kDefaultOracleTimeoutMs);

  auto* lifecycle = config->mutable_lifecycle();
  if (lifecycle->default_refresh_interval_sec() == 0) lifecycle->set_default_refresh_interval_sec(kDefaultRefreshInterval);
  if (lifecycle->heal_window_sec() == 0) lifecycle->set_heal_window_sec(kDefaultHealWindowSec);
  if (lifecycle->heal_max_failures_in_window() == 0) lifecycle->set_heal_max_failures_in_window(kDefaultHealMaxFailures);

  if (config->database().has_sqlite() && config->database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config->database().has_postgres() && config->database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
}

} // namespace blockforge::config
