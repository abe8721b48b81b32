#include "memory_instance_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/store/common/instance_update.hpp"
#include "internal/util/errors.hpp"

namespace localrun::store::memory {

using localrun::plan::v1::Node;
using localrun::plan::v1::NodeInstance;
using observability::IntField;
using observability::StringField;

std::vector<std::string> MemoryInstanceStore::InstanceIds(const std::vector<NodeInstance>& instances) {
  std::vector<std::string> ids;
  ids.reserve(instances.size());
  for (const auto& instance : instances) {
    ids.push_back(instance.id());
  }
  return ids;
}

MemoryInstanceStore::MemoryInstanceStore(StoreSeed seed)
    : name_(std::move(seed.name)),
      resources_(std::move(seed.resources_root)),
      nodes_(seed.nodes),
      locks_(InstanceIds(seed.node_instances)) {
  for (auto& instance : seed.node_instances) {
    instance.set_version(0);
    auto id = instance.id();
    instances_.emplace(std::move(id), std::move(instance));
  }

  LOCALRUN_LOG_INFO("Memory instance store ready",
                    {StringField("deployment", name_), IntField("node_instances", static_cast<std::int64_t>(instances_.size()))});
}

std::string MemoryInstanceStore::GetResource(const std::string& resource_path) const {
  return resources_.Read(resource_path);
}

std::string MemoryInstanceStore::DownloadResource(const std::string& resource_path, const std::optional<std::string>& target_path) const {
  return resources_.Download(resource_path, target_path);
}

Node MemoryInstanceStore::GetNode(const std::string& node_id) const {
  return nodes_.Get(node_id);
}

std::vector<Node> MemoryInstanceStore::GetNodes() const {
  return nodes_.List();
}

NodeInstance MemoryInstanceStore::GetNodeInstance(const std::string& node_instance_id) const {
  std::lock_guard lock(locks_.For(node_instance_id));
  return instances_.at(node_instance_id);
}

std::vector<NodeInstance> MemoryInstanceStore::GetNodeInstances() const {
  std::vector<NodeInstance> instances;
  instances.reserve(instances_.size());
  for (const auto& [id, instance] : instances_) {
    std::lock_guard lock(locks_.For(id));
    instances.push_back(instance);
  }
  return instances;
}

void MemoryInstanceStore::UpdateNodeInstance(const std::string& node_instance_id, std::uint64_t expected_version,
                                             const std::optional<google::protobuf::Struct>& runtime_properties,
                                             const std::optional<std::string>&              state) {
  std::lock_guard lock(locks_.For(node_instance_id));
  common::ApplyInstanceUpdate(instances_.at(node_instance_id), expected_version, runtime_properties, state);
}

} // namespace localrun::store::memory
