#include "file_instance_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/store/common/instance_update.hpp"
#include "internal/store/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace localrun::store::file {

using localrun::plan::v1::Node;
using localrun::plan::v1::NodeInstance;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

std::string Serialize(const NodeInstance& instance) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(instance, &json, options);
  if (!status.ok()) {
    throw util::StorageError("Failed to serialize node instance " + instance.id() + ": " + std::string(status.message()));
  }
  return json;
}

NodeInstance Deserialize(const std::string& json, const std::filesystem::path& path) {
  NodeInstance instance;
  auto         status = google::protobuf::util::JsonStringToMessage(json, &instance);
  if (!status.ok()) {
    throw util::StorageError("Corrupt node instance file " + path.string() + ": " + std::string(status.message()));
  }
  return instance;
}

/*
  Atomic write:
      write tmp -> flush -> rename

  Callers hold the instance lock, or run before the store is shared.
*/
void WriteInstanceFile(const std::filesystem::path& instances_dir, const NodeInstance& instance) {
  const auto final_path = common::InstancePath(instances_dir, instance.id());
  auto       tmp_path   = final_path;
  tmp_path += ".tmp";

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::StorageError("Failed to open " + tmp_path.string() + " for writing");
    }
    out << Serialize(instance);
    out.flush();
    if (!out) {
      throw util::StorageError("Failed to write " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    throw util::StorageError("Failed to replace " + final_path.string() + ": " + ec.message());
  }
}

std::vector<std::string> ListInstanceIds(const std::filesystem::path& instances_dir) {
  std::vector<std::string> ids;
  std::error_code          ec;
  for (std::filesystem::directory_iterator it(instances_dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec) || common::IsTempFile(it->path())) {
      ec.clear();
      continue;
    }
    ids.push_back(it->path().filename().string());
  }
  if (ec) {
    throw util::StorageError("Failed to list " + instances_dir.string() + ": " + ec.message());
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::filesystem::path DeploymentDir(const std::filesystem::path& storage_dir, const std::string& name) {
  if (name.empty()) {
    throw util::ConfigurationError("file storage requires a deployment name");
  }
  common::ValidateInstanceId(name);
  return storage_dir / name;
}

} // namespace

FileInstanceStore::FileInstanceStore(StoreSeed seed, std::filesystem::path storage_dir, bool clear)
    : name_(std::move(seed.name)),
      resources_(std::move(seed.resources_root)),
      nodes_(seed.nodes),
      deployment_dir_(DeploymentDir(storage_dir, name_)),
      instances_dir_(deployment_dir_ / kInstancesDirName),
      locks_(PrepareInstancesDir(deployment_dir_, instances_dir_, clear, seed.node_instances)) {
}

std::vector<std::string> FileInstanceStore::PrepareInstancesDir(const std::filesystem::path& deployment_dir,
                                                                const std::filesystem::path& instances_dir, bool clear,
                                                                std::vector<NodeInstance>& seed_instances) {
  std::error_code ec;
  if (clear) {
    std::filesystem::remove_all(deployment_dir, ec);
    if (ec) {
      throw util::StorageError("Failed to clear " + deployment_dir.string() + ": " + ec.message());
    }
  }
  std::filesystem::create_directories(deployment_dir, ec);
  if (ec) {
    throw util::StorageError("Failed to create " + deployment_dir.string() + ": " + ec.message());
  }

  const bool reuse = std::filesystem::is_directory(instances_dir, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw util::StorageError("Failed to inspect " + instances_dir.string() + ": " + ec.message());
  }

  if (!reuse) {
    std::set<std::string> seen;
    for (const auto& instance : seed_instances) {
      common::ValidateInstanceId(instance.id());
      if (!seen.insert(instance.id()).second) {
        throw util::ConfigurationError("duplicate node instance id " + instance.id());
      }
    }

    std::filesystem::create_directory(instances_dir, ec);
    if (ec) {
      throw util::StorageError("Failed to create " + instances_dir.string() + ": " + ec.message());
    }
    // No readers exist yet, so the seed is written without locking.
    for (auto& instance : seed_instances) {
      instance.set_version(0);
      WriteInstanceFile(instances_dir, instance);
    }
    LOCALRUN_LOG_INFO("Materialized node instances",
                      {StringField("dir", instances_dir.string()), IntField("node_instances", static_cast<std::int64_t>(seed_instances.size())),
                       BoolField("cleared", clear)});
  } else {
    LOCALRUN_LOG_INFO("Reusing node instance state from previous run", {StringField("dir", instances_dir.string())});
  }

  // The directory is the source of truth from here on.
  seed_instances.clear();
  return ListInstanceIds(instances_dir);
}

std::string FileInstanceStore::GetResource(const std::string& resource_path) const {
  return resources_.Read(resource_path);
}

std::string FileInstanceStore::DownloadResource(const std::string& resource_path, const std::optional<std::string>& target_path) const {
  return resources_.Download(resource_path, target_path);
}

Node FileInstanceStore::GetNode(const std::string& node_id) const {
  return nodes_.Get(node_id);
}

std::vector<Node> FileInstanceStore::GetNodes() const {
  return nodes_.List();
}

NodeInstance FileInstanceStore::LoadInstance(const std::string& node_instance_id) const {
  std::lock_guard lock(locks_.For(node_instance_id));

  const auto    path = common::InstancePath(instances_dir_, node_instance_id);
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::NotFound("Instance " + node_instance_id + " does not exist");
  }
  const std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return Deserialize(json, path);
}

void FileInstanceStore::StoreInstance(const NodeInstance& instance) const {
  std::lock_guard lock(locks_.For(instance.id()));
  WriteInstanceFile(instances_dir_, instance);
}

NodeInstance FileInstanceStore::GetNodeInstance(const std::string& node_instance_id) const {
  return LoadInstance(node_instance_id);
}

std::vector<NodeInstance> FileInstanceStore::GetNodeInstances() const {
  std::vector<NodeInstance> instances;
  for (const auto& id : locks_.Ids()) {
    instances.push_back(LoadInstance(id));
  }
  return instances;
}

void FileInstanceStore::UpdateNodeInstance(const std::string& node_instance_id, std::uint64_t expected_version,
                                           const std::optional<google::protobuf::Struct>& runtime_properties,
                                           const std::optional<std::string>&              state) {
  // LoadInstance and StoreInstance re-acquire this lock.
  std::lock_guard lock(locks_.For(node_instance_id));

  auto instance = LoadInstance(node_instance_id);
  common::ApplyInstanceUpdate(instance, expected_version, runtime_properties, state);
  StoreInstance(instance);
}

} // namespace localrun::store::file
