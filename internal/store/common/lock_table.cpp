#include "lock_table.hpp"

#include "internal/util/errors.hpp"

namespace localrun::store::common {

InstanceLockTable::InstanceLockTable(const std::vector<std::string>& node_instance_ids) {
  for (const auto& id : node_instance_ids) {
    if (!locks_.try_emplace(id).second) {
      throw util::ConfigurationError("duplicate node instance id " + id);
    }
  }
}

std::recursive_mutex& InstanceLockTable::For(const std::string& node_instance_id) const {
  auto it = locks_.find(node_instance_id);
  if (it == locks_.end()) {
    throw util::NotFound("Instance " + node_instance_id + " does not exist");
  }
  return it->second;
}

std::vector<std::string> InstanceLockTable::Ids() const {
  std::vector<std::string> ids;
  ids.reserve(locks_.size());
  for (const auto& [id, _] : locks_) {
    ids.push_back(id);
  }
  return ids;
}

} // namespace localrun::store::common
