#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace apparatus::config {

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

// Quoted scalars carry the non-specific "!" tag and always stay strings.
bool IsQuoted(const YAML::Node& node) {
  return node.Tag() == "!";
}

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  if (!IsQuoted(node)) {
    if (scalar == "true" || scalar == "false") {
      value->set_bool_value(scalar == "true");
      return;
    }

    char*        endptr  = nullptr;
    const double numeric = std::strtod(scalar.c_str(), &endptr);
    if (!scalar.empty() && endptr && *endptr == '\0') {
      value->set_number_value(numeric);
      return;
    }
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
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

apparatus::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  apparatus::runtime::config::RuntimeConfig config;

  // An empty document is a valid config: every section takes its defaults.
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top-level YAML node must be a map");
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

} // namespace

apparatus::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

apparatus::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

} // namespace apparatus::config
