#include "node_catalog.hpp"

#include "internal/util/errors.hpp"

namespace localrun::store::common {

NodeCatalog::NodeCatalog(const std::vector<localrun::plan::v1::Node>& nodes) {
  for (const auto& node : nodes) {
    if (!nodes_.emplace(node.id(), node).second) {
      throw util::ConfigurationError("duplicate node id " + node.id());
    }
  }
}

localrun::plan::v1::Node NodeCatalog::Get(const std::string& node_id) const {
  auto it = nodes_.find(node_id);
  if (it == nodes_.end()) {
    throw util::NotFound("Node " + node_id + " does not exist");
  }
  return it->second;
}

std::vector<localrun::plan::v1::Node> NodeCatalog::List() const {
  std::vector<localrun::plan::v1::Node> nodes;
  nodes.reserve(nodes_.size());
  for (const auto& [_, node] : nodes_) {
    nodes.push_back(node);
  }
  return nodes;
}

} // namespace localrun::store::common
