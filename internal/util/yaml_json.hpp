#pragma once

#include <google/protobuf/struct.pb.h>
#include <yaml-cpp/yaml.h>

#include <string>

namespace localrun::util {

/*
  YAML -> google.protobuf.Value -> JSON.

  Loaders parse YAML (or JSON, which yaml-cpp accepts) into a Value tree and
  then let protobuf's JSON parser map it onto the target message. Only plain
  (unquoted) scalars are typed as bool/number/null; quoted scalars always stay
  strings.
*/

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

// Throws std::runtime_error when the file cannot be read or parsed.
google::protobuf::Value LoadYamlFile(const std::string& path);

std::string ToJson(const google::protobuf::Value& value);

} // namespace localrun::util
