#include "plan_loader.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/yaml_json.hpp"

namespace localrun::plan {

namespace {

void MapInstanceNames(google::protobuf::Value* document) {
  if (document->kind_case() != google::protobuf::Value::kStructValue) {
    return;
  }

  auto& fields = *document->mutable_struct_value()->mutable_fields();
  auto  it     = fields.find("node_instances");
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kListValue) {
    return;
  }

  for (auto& entry : *it->second.mutable_list_value()->mutable_values()) {
    if (entry.kind_case() != google::protobuf::Value::kStructValue) {
      continue;
    }
    auto& instance = *entry.mutable_struct_value()->mutable_fields();
    auto  name     = instance.find("name");
    if (name != instance.end() && instance.count("node_id") == 0) {
      google::protobuf::Value node_id = name->second;
      instance["node_id"]             = std::move(node_id);
    }
  }
}

} // namespace

localrun::plan::v1::Plan PlanLoader::LoadFromFile(const std::string& path) {
  google::protobuf::Value document;
  try {
    document = util::LoadYamlFile(path);
  } catch (const std::runtime_error& e) {
    throw util::ConfigurationError("Failed to load deployment plan: " + std::string(e.what()));
  }

  if (document.kind_case() != google::protobuf::Value::kStructValue) {
    throw util::ConfigurationError("Deployment plan " + path + " is not a mapping");
  }

  MapInstanceNames(&document);

  localrun::plan::v1::Plan plan;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(util::ToJson(document), &plan, options);
  if (!status.ok()) {
    throw util::ConfigurationError("Invalid deployment plan " + path + ": " + std::string(status.message()));
  }

  return plan;
}

} // namespace localrun::plan
