#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/store/api/instance_store.hpp"
#include "internal/store/common/lock_table.hpp"
#include "internal/store/common/node_catalog.hpp"
#include "internal/store/common/resource_root.hpp"

namespace localrun::store::file {

/*
  Durable instance store: one JSON file per node instance.

  Layout:
      <storage_dir>/<deployment name>/node-instances/<node instance id>

  Properties:
    - first run writes the seed instances out once; later runs reuse the
      directory as-is and ignore the seed
    - the listing taken at construction is the fixed instance set
    - atomic replace writes (tmp -> rename)
*/
class FileInstanceStore final : public InstanceStore {
 public:
  static constexpr const char* kDefaultStorageDir = "/tmp/localrun-workflows";
  static constexpr const char* kInstancesDirName  = "node-instances";

  FileInstanceStore(StoreSeed seed, std::filesystem::path storage_dir, bool clear);

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

  const std::filesystem::path& InstancesDir() const {
    return instances_dir_;
  }

 private:
  // Clears / materializes the instances directory and returns the instance ids found there.
  static std::vector<std::string> PrepareInstancesDir(const std::filesystem::path& deployment_dir, const std::filesystem::path& instances_dir,
                                                      bool clear, std::vector<localrun::plan::v1::NodeInstance>& seed_instances);

  localrun::plan::v1::NodeInstance LoadInstance(const std::string& node_instance_id) const;
  void                             StoreInstance(const localrun::plan::v1::NodeInstance& instance) const;

  std::string               name_;
  common::ResourceRoot      resources_;
  common::NodeCatalog       nodes_;
  std::filesystem::path     deployment_dir_;
  std::filesystem::path     instances_dir_;
  common::InstanceLockTable locks_;
};

} // namespace localrun::store::file
