#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "localrun/plan/v1/plan.pb.h"

namespace localrun::store {

/*
  Everything a backend needs to come up for one deployment.
  Instance versions are reset to 0 on construction.
*/
struct StoreSeed {
  std::string                                 name;
  std::filesystem::path                       resources_root;
  std::vector<localrun::plan::v1::Node>         nodes;
  std::vector<localrun::plan::v1::NodeInstance> node_instances;
};

/*
  Instance store abstraction.

  CRITICAL GUARANTEES (all backends):

  - Returned nodes and instances are independent copies.
  - The instance set is fixed at construction.
  - UpdateNodeInstance holds the instance's lock for the whole call:
      * state absent  -> expected_version must equal the stored version,
                         otherwise util::ConflictError and nothing is written
      * state present -> version check bypassed
    An accepted update increments the version by exactly one, replaces
    runtime_properties when given, sets state when given, and persists.
  - One reentrant lock per instance; no call ever holds two of them.
  - Instances are listed in ascending id order.
*/
class InstanceStore {
 public:
  virtual ~InstanceStore() = default;

  virtual const std::string& Name() const = 0;

  // ---------------------------------------------------------------------
  // Resources (relative to the blueprint directory)
  // ---------------------------------------------------------------------

  virtual std::string GetResource(const std::string& resource_path) const = 0;

  // Writes to target_path, or to a fresh temporary file when absent.
  // Returns the path written.
  virtual std::string DownloadResource(const std::string&                resource_path,
                                       const std::optional<std::string>& target_path) const = 0;

  // ---------------------------------------------------------------------
  // Nodes (read-only)
  // ---------------------------------------------------------------------

  virtual localrun::plan::v1::Node              GetNode(const std::string& node_id) const = 0;
  virtual std::vector<localrun::plan::v1::Node> GetNodes() const                        = 0;

  // ---------------------------------------------------------------------
  // Node instances
  // ---------------------------------------------------------------------

  virtual localrun::plan::v1::NodeInstance              GetNodeInstance(const std::string& node_instance_id) const = 0;
  virtual std::vector<localrun::plan::v1::NodeInstance> GetNodeInstances() const                                 = 0;

  virtual void UpdateNodeInstance(const std::string& node_instance_id, std::uint64_t expected_version,
                                  const std::optional<google::protobuf::Struct>& runtime_properties,
                                  const std::optional<std::string>&              state) = 0;
};

using InstanceStorePtr = std::shared_ptr<InstanceStore>;

} // namespace localrun::store
