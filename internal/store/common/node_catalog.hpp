#pragma once

#include <map>
#include <string>
#include <vector>

#include "localrun/plan/v1/plan.pb.h"

namespace localrun::store::common {

/*
  Read-only node table. Never mutated after construction, so reads need no lock.
*/
class NodeCatalog {
 public:
  explicit NodeCatalog(const std::vector<localrun::plan::v1::Node>& nodes);

  // Throws util::NotFound for unknown ids.
  localrun::plan::v1::Node              Get(const std::string& node_id) const;
  std::vector<localrun::plan::v1::Node> List() const;

 private:
  std::map<std::string, localrun::plan::v1::Node> nodes_;
};

} // namespace localrun::store::common
