#pragma once

#include <google/protobuf/struct.pb.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>

#include "internal/store/api/instance_store.hpp"
#include "internal/util/errors.hpp"
#include "localrun/plan/v1/plan.pb.h"

namespace localrun::testing {

inline std::filesystem::path TestDir(const std::string& suite, const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / ("localrun_" + suite) / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline std::filesystem::path WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  out.close();
  return path;
}

// True when fn throws exactly E (or a subclass).
template <typename E>
bool Throws(const std::function<void()>& fn, std::string* message = nullptr) {
  try {
    fn();
  } catch (const E& e) {
    if (message) {
      *message = e.what();
    }
    return true;
  }
  return false;
}

inline localrun::plan::v1::Node MakeNode(const std::string& id, const std::string& create_operation = "test.lifecycle.create") {
  localrun::plan::v1::Node node;
  node.set_id(id);
  node.set_type("test.nodes.Compute");
  if (!create_operation.empty()) {
    (*node.mutable_operations())["create"].set_operation(create_operation);
  }
  return node;
}

inline localrun::plan::v1::NodeInstance MakeInstance(const std::string& id, const std::string& node_id) {
  localrun::plan::v1::NodeInstance instance;
  instance.set_id(id);
  instance.set_node_id(node_id);
  instance.set_state("uninitialized");
  // Seeds may carry stale versions; stores reset them.
  instance.set_version(7);
  return instance;
}

/*
  Two nodes, three instances:
      vm          -> vm_1
      web_server  -> web_server_1, web_server_2
*/
inline store::StoreSeed MakeSeed(const std::string& name, const std::filesystem::path& resources_root) {
  store::StoreSeed seed;
  seed.name           = name;
  seed.resources_root = resources_root;
  seed.nodes          = {MakeNode("vm"), MakeNode("web_server")};
  seed.node_instances = {MakeInstance("web_server_2", "web_server"), MakeInstance("vm_1", "vm"), MakeInstance("web_server_1", "web_server")};
  return seed;
}

/*
  Plan over the MakeSeed topology: web_server connects to vm, workflow
  "deploy" needs x, workflow "install" only has defaults, and the outputs
  read every web_server ip.
*/
inline localrun::plan::v1::Plan MakePlan() {
  localrun::plan::v1::Plan plan;

  *plan.add_nodes() = MakeNode("vm");

  auto* web_server = plan.add_nodes();
  *web_server      = MakeNode("web_server");
  auto* connected  = web_server->add_relationships();
  connected->set_type("test.relationships.connected_to");
  connected->set_target_id("vm");
  (*connected->mutable_source_operations())["establish"].set_operation("test.relationships.connect");

  *plan.add_node_instances() = MakeInstance("vm_1", "vm");
  *plan.add_node_instances() = MakeInstance("web_server_1", "web_server");
  *plan.add_node_instances() = MakeInstance("web_server_2", "web_server");

  auto& deploy = (*plan.mutable_workflows())["deploy"];
  deploy.set_name("deploy");
  deploy.set_operation("test.workflows.deploy");
  (*deploy.mutable_parameters())["x"].set_description("required");

  auto& install = (*plan.mutable_workflows())["install"];
  install.set_name("install");
  install.set_operation("test.workflows.install");
  (*install.mutable_parameters())["greeting"].mutable_default_value()->set_string_value("hello");

  auto& outputs = *plan.mutable_outputs()->mutable_fields();
  auto* args    = (*outputs["endpoints"].mutable_struct_value()->mutable_fields())["value"]
                   .mutable_struct_value()
                   ->mutable_fields();
  auto* list = (*args)["get_attribute"].mutable_list_value();
  list->add_values()->set_string_value("web_server");
  list->add_values()->set_string_value("ip");
  (*outputs["port"].mutable_struct_value()->mutable_fields())["value"].set_number_value(8080);

  return plan;
}

inline store::StoreSeed SeedFromPlan(const localrun::plan::v1::Plan& plan, const std::string& name, const std::filesystem::path& resources_root) {
  store::StoreSeed seed;
  seed.name           = name;
  seed.resources_root = resources_root;
  seed.nodes.assign(plan.nodes().begin(), plan.nodes().end());
  seed.node_instances.assign(plan.node_instances().begin(), plan.node_instances().end());
  return seed;
}

inline google::protobuf::Struct Properties(const std::string& key, const std::string& value) {
  google::protobuf::Struct properties;
  (*properties.mutable_fields())[key].set_string_value(value);
  return properties;
}

// Reload-and-retry on ConflictError, the way workflow code writes runtime properties.
inline void IncrementCounter(store::InstanceStore& store, const std::string& node_instance_id) {
  for (;;) {
    auto instance   = store.GetNodeInstance(node_instance_id);
    auto properties = instance.runtime_properties();
    auto& counter   = (*properties.mutable_fields())["counter"];
    counter.set_number_value(counter.number_value() + 1);
    try {
      store.UpdateNodeInstance(node_instance_id, instance.version(), properties, std::nullopt);
      return;
    } catch (const util::ConflictError&) {
      // stale read, reload
    }
  }
}

} // namespace localrun::testing
