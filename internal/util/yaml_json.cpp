#include "yaml_json.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <cstdlib>
#include <regex>
#include <stdexcept>

namespace localrun::util {

namespace {

bool IsPlain(const YAML::Node& node) {
  return node.Tag() == "?";
}

// Decimal ints and floats only; hex, octal, inf and nan stay strings.
bool IsDecimalNumber(const std::string& scalar) {
  static const std::regex kDecimal(R"([-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?)");
  return std::regex_match(scalar, kDecimal);
}

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  if (!IsPlain(node)) {
    value->set_string_value(scalar_value);
    return;
  }

  // detect null / bool / numeric
  if (scalar_value == "~" || scalar_value == "null" || scalar_value == "Null" || scalar_value == "NULL") {
    value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (IsDecimalNumber(scalar_value)) {
    const double numeric_value = std::strtod(scalar_value.c_str(), nullptr);
    if (std::isfinite(numeric_value)) {
      value->set_number_value(numeric_value);
      return;
    }
  }

  value->set_string_value(scalar_value);
}

} // namespace

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

google::protobuf::Value LoadYamlFile(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML file " + path + ": " + std::string(e.what()));
  }

  google::protobuf::Value value;
  YamlToProtoValue(yaml, &value);
  return value;
}

std::string ToJson(const google::protobuf::Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }
  return json;
}

} // namespace localrun::util
