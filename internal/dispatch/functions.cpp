#include "functions.hpp"

#include "internal/util/errors.hpp"

namespace localrun::dispatch {

namespace {

void ScanValue(google::protobuf::Value& value, const ValueHandler& handler, const std::string& path) {
  if (handler(value, path)) {
    return;
  }

  switch (value.kind_case()) {
    case google::protobuf::Value::kStructValue:
      for (auto& [key, field] : *value.mutable_struct_value()->mutable_fields()) {
        ScanValue(field, handler, path + "." + key);
      }
      break;

    case google::protobuf::Value::kListValue: {
      auto& items = *value.mutable_list_value()->mutable_values();
      for (int i = 0; i < items.size(); ++i) {
        ScanValue(items[i], handler, path + "[" + std::to_string(i) + "]");
      }
      break;
    }

    default:
      break;
  }
}

} // namespace

std::optional<GetAttribute> ParseGetAttribute(const google::protobuf::Value& value) {
  if (value.kind_case() != google::protobuf::Value::kStructValue) {
    return std::nullopt;
  }

  const auto& fields = value.struct_value().fields();
  if (fields.size() != 1) {
    return std::nullopt;
  }
  auto it = fields.find(kGetAttributeFunction);
  if (it == fields.end()) {
    return std::nullopt;
  }

  const auto& args = it->second;
  if (args.kind_case() != google::protobuf::Value::kListValue || args.list_value().values_size() != 2 ||
      args.list_value().values(0).kind_case() != google::protobuf::Value::kStringValue ||
      args.list_value().values(1).kind_case() != google::protobuf::Value::kStringValue) {
    throw util::ConfigurationError("Illegal arguments passed to get_attribute function: expected [node_name, attribute_name]");
  }

  return GetAttribute{args.list_value().values(0).string_value(), args.list_value().values(1).string_value()};
}

void ScanProperties(google::protobuf::Struct& root, const ValueHandler& handler, const std::string& scope) {
  for (auto& [key, value] : *root.mutable_fields()) {
    ScanValue(value, handler, scope + "." + key);
  }
}

} // namespace localrun::dispatch
