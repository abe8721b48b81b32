#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace localrun::store::common {

/*
  One reentrant lock per node instance.

  Built once for the fixed instance set and never resized, so looking a lock
  up needs no guard of its own. Reentrancy lets the load/store helpers of a
  backend re-acquire the lock an update already holds.
*/
class InstanceLockTable {
 public:
  explicit InstanceLockTable(const std::vector<std::string>& node_instance_ids);

  InstanceLockTable(const InstanceLockTable&)            = delete;
  InstanceLockTable& operator=(const InstanceLockTable&) = delete;

  // Throws util::NotFound for ids outside the instance set.
  std::recursive_mutex& For(const std::string& node_instance_id) const;

  bool Contains(const std::string& node_instance_id) const {
    return locks_.find(node_instance_id) != locks_.end();
  }

  // Ascending id order.
  std::vector<std::string> Ids() const;

 private:
  mutable std::map<std::string, std::recursive_mutex> locks_;
};

} // namespace localrun::store::common
