#pragma once

#include <map>
#include <string>
#include <vector>

#include "internal/store/api/instance_store.hpp"
#include "internal/store/common/lock_table.hpp"
#include "internal/store/common/node_catalog.hpp"
#include "internal/store/common/resource_root.hpp"

namespace localrun::store::memory {

/*
  Instance state held in process memory only.

  The instance map is never restructured after construction; each entry is
  read and written under its own instance lock.
*/
class MemoryInstanceStore final : public InstanceStore {
 public:
  explicit MemoryInstanceStore(StoreSeed seed);

  const std::string& Name() const override {
    return name_;
  }

  std::string GetResource(const std::string& resource_path) const override;
  std::string DownloadResource(const std::string& resource_path, const std::optional<std::string>& target_path) const override;

  localrun::plan::v1::Node              GetNode(const std::string& node_id) const override;
  std::vector<localrun::plan::v1::Node> GetNodes() const override;

  localrun::plan::v1::NodeInstance              GetNodeInstance(const std::string& node_instance_id) const override;
  std::vector<localrun::plan::v1::NodeInstance> GetNodeInstances() const override;

  void UpdateNodeInstance(const std::string& node_instance_id, std::uint64_t expected_version,
                          const std::optional<google::protobuf::Struct>& runtime_properties,
                          const std::optional<std::string>&              state) override;

 private:
  static std::vector<std::string> InstanceIds(const std::vector<localrun::plan::v1::NodeInstance>& instances);

  std::string          name_;
  common::ResourceRoot resources_;
  common::NodeCatalog  nodes_;
  // Lock table first: it rejects duplicate ids before the map is built.
  common::InstanceLockTable                               locks_;
  std::map<std::string, localrun::plan::v1::NodeInstance> instances_;
};

} // namespace localrun::store::memory
