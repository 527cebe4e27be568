#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace unison::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the "!" tag
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
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

static unison::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  unison::runtime::config::RuntimeConfig config;

  // empty document
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
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

static uint32_t ParseEnvUint(const char* name, const char* raw) {
  const std::string text(raw);
  char*             endptr = nullptr;
  errno                    = 0;
  const auto parsed        = std::strtoll(text.c_str(), &endptr, 10);

  if (text.empty() || endptr == nullptr || *endptr != '\0' || errno == ERANGE || parsed < 0 ||
      parsed > std::numeric_limits<uint32_t>::max()) {
    throw std::runtime_error(std::string(name) + " must be a non-negative integer, got '" + text + "'");
  }
  return static_cast<uint32_t>(parsed);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

unison::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return FromYamlNode(yaml);
}

unison::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return FromYamlNode(yaml);
}

void ConfigLoader::ApplyEnvironment(unison::runtime::config::RuntimeConfig& config) {
  auto* queue = config.mutable_queue();

  if (const char* raw = std::getenv("QUEUE_VISIBILITY_TIMEOUT")) {
    const auto vt = ParseEnvUint("QUEUE_VISIBILITY_TIMEOUT", raw);
    if (vt == 0) {
      throw std::runtime_error("QUEUE_VISIBILITY_TIMEOUT must be positive");
    }
    queue->set_visibility_timeout_sec(vt);
  }

  if (const char* raw = std::getenv("QUEUE_MAX_RETRIES")) {
    queue->set_max_retries(ParseEnvUint("QUEUE_MAX_RETRIES", raw));
  }

  if (const char* raw = std::getenv("QUEUE_NAME_PREFIX")) {
    queue->set_name_prefix(raw);
  }

  if (const char* raw = std::getenv("UNISON_DATABASE_URL"); raw != nullptr && *raw != '\0') {
    // keeps max_connections when postgres was already selected
    config.mutable_database()->mutable_postgres()->set_connection_uri(raw);
  }
}

} // namespace unison::config
