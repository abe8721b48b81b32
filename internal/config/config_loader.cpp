#include "config_loader.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/yaml_json.hpp"

namespace localrun::config {

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

localrun::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  google::protobuf::Value yaml_value;
  std::string             json;
  try {
    yaml_value = util::LoadYamlFile(path);
    json       = util::ToJson(yaml_value);
  } catch (const std::runtime_error& e) {
    throw util::ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }

  localrun::runtime::config::RuntimeConfig config;

  // An empty document is a valid, all-defaults configuration.
  if (yaml_value.kind_case() == google::protobuf::Value::kNullValue) {
    return config;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

} // namespace localrun::config
