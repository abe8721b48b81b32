#pragma once

#include <google/protobuf/struct.pb.h>

#include <functional>
#include <optional>
#include <string>

namespace localrun::dispatch {

inline constexpr const char* kGetAttributeFunction = "get_attribute";

// {"get_attribute": [node_name, attribute_name]}
struct GetAttribute {
  std::string node_name;
  std::string attribute_name;
};

/*
  Recognizes a get_attribute expression. Returns nullopt for any other value.
  Throws util::ConfigurationError when the expression is malformed.
*/
std::optional<GetAttribute> ParseGetAttribute(const google::protobuf::Value& value);

/*
  Walks every value below root (struct fields and list items). The handler
  returns true when it replaced the value; replaced values are not descended
  into.
*/
using ValueHandler = std::function<bool(google::protobuf::Value& value, const std::string& path)>;

void ScanProperties(google::protobuf::Struct& root, const ValueHandler& handler, const std::string& scope);

} // namespace localrun::dispatch
