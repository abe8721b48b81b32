#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace localrun::store::common {

// Instance ids are used verbatim as file names.
inline void ValidateInstanceId(const std::string& node_instance_id) {
  if (node_instance_id.empty()) {
    throw util::ConfigurationError("node instance id must not be empty");
  }
  for (char c : node_instance_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::ConfigurationError("node instance id '" + node_instance_id + "' contains invalid character");
    }
  }
  if (node_instance_id == "." || node_instance_id == "..") {
    throw util::ConfigurationError("node instance id must not be a relative path component");
  }
  if (std::filesystem::path(node_instance_id).extension() == ".tmp") {
    throw util::ConfigurationError("node instance id '" + node_instance_id + "' collides with temporary file names");
  }
}

inline std::filesystem::path InstancePath(const std::filesystem::path& root, const std::string& node_instance_id) {
  ValidateInstanceId(node_instance_id);
  return root / node_instance_id;
}

inline bool IsTempFile(const std::filesystem::path& path) {
  return path.extension() == ".tmp";
}

} // namespace localrun::store::common
