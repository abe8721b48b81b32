#include "resource_root.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace localrun::store::common {

ResourceRoot::ResourceRoot(std::filesystem::path root) : root_(std::move(root)) {
}

std::string ResourceRoot::Read(const std::string& resource_path) const {
  const auto      path = root_ / resource_path;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw util::NotFound("Resource " + resource_path + " does not exist under " + root_.string());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::StorageError("Failed to open resource " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/*
  Without a target the resource lands in the temp directory as
  localrun-<uuid>-<basename>.
*/
std::string ResourceRoot::Download(const std::string& resource_path, const std::optional<std::string>& target_path) const {
  std::filesystem::path target;
  if (target_path && !target_path->empty()) {
    target = *target_path;
  } else {
    std::error_code ec;
    const auto      temp_dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
      throw util::StorageError("No temporary directory for resource " + resource_path + ": " + ec.message());
    }
    const auto basename = std::filesystem::path(resource_path).filename().string();
    target              = temp_dir / ("localrun-" + util::ToString(util::GenerateUUID()) + "-" + basename);
  }

  const auto resource = Read(resource_path);

  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw util::StorageError("Failed to open " + target.string() + " for writing");
  }
  out.write(resource.data(), static_cast<std::streamsize>(resource.size()));
  if (!out) {
    throw util::StorageError("Failed to write resource " + resource_path + " to " + target.string());
  }

  return target.string();
}

} // namespace localrun::store::common
