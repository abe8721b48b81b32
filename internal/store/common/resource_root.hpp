#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace localrun::store::common {

/*
  Blueprint resources, resolved relative to the blueprint directory.
*/
class ResourceRoot {
 public:
  explicit ResourceRoot(std::filesystem::path root);

  // Throws util::NotFound when the resource does not exist.
  std::string Read(const std::string& resource_path) const;

  std::string Download(const std::string& resource_path, const std::optional<std::string>& target_path) const;

 private:
  std::filesystem::path root_;
};

} // namespace localrun::store::common
