#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace tablebook::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars carry the "!" tag
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

template <typename Message>
static Message YamlToMessage(const YAML::Node& yaml, const std::string& what) {
  Message message;
  if (yaml.IsNull()) {
    return message;
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

  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid " + what + ": " + std::string(status.message()));
  }
  return message;
}

template <typename Message>
static Message LoadYamlFile(const std::string& path, const std::string& what) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML " + what + " '" + path + "': " + std::string(e.what()));
  }
  return YamlToMessage<Message>(yaml, what);
}

template <typename Message>
static Message LoadYamlString(const std::string& text, const std::string& what) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML " + what + ": " + std::string(e.what()));
  }
  return YamlToMessage<Message>(yaml, what);
}

// ------------------------------------------------------------
// Public loaders
// ------------------------------------------------------------

tablebook::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  return LoadYamlFile<tablebook::runtime::config::RuntimeConfig>(path, "configuration");
}

tablebook::core::v1::RestaurantCatalog ConfigLoader::LoadCatalogFromYaml(const std::string& path) {
  return LoadYamlFile<tablebook::core::v1::RestaurantCatalog>(path, "catalog");
}

tablebook::runtime::config::RuntimeConfig ConfigLoader::ParseYaml(const std::string& yaml) {
  return LoadYamlString<tablebook::runtime::config::RuntimeConfig>(yaml, "configuration");
}

tablebook::core::v1::RestaurantCatalog ConfigLoader::ParseCatalogYaml(const std::string& yaml) {
  return LoadYamlString<tablebook::core::v1::RestaurantCatalog>(yaml, "catalog");
}

} // namespace tablebook::config
