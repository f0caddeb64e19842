#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace freight::config {

namespace {

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

// Quoted scalars stay strings; plain ones are typed as bool, number or string.
void ScalarToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();

  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  if (!text.empty()) {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end && *end == '\0') {
      value->set_number_value(number);
      return;
    }
  }

  value->set_string_value(text);
}

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ScalarToProtoValue(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        ToProtoValue(item, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      return;
    }
  }

  throw std::runtime_error("config: unsupported YAML node");
}

freight::runtime::config::RuntimeConfig FromNode(const YAML::Node& root);

} // namespace

// ------------------------------------------------------------
// Public loaders
// ------------------------------------------------------------

freight::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("config: file not found: " + path);
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("config: failed to parse " + path + ": " + e.what());
  }
  return FromNode(root);
}

freight::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("config: failed to parse YAML: ") + e.what());
  }
  return FromNode(root);
}

namespace {

freight::runtime::config::RuntimeConfig FromNode(const YAML::Node& root) {
  freight::runtime::config::RuntimeConfig config;

  // An empty document is a valid config: every section falls back to defaults.
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw std::runtime_error("config: top-level YAML node must be a mapping");
  }

  google::protobuf::Value value;
  ToProtoValue(root, &value);

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(value, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("config: failed to render YAML as JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("config: invalid configuration: " + std::string(status.message()));
  }

  return config;
}

} // namespace

} // namespace freight::config
