#include "operation_registry.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace localrun::dispatch {

std::pair<std::string, std::string> SplitOperationPath(const std::string& path) {
  const auto dot = path.rfind('.');
  if (dot == std::string::npos) {
    return {std::string(), path};
  }
  return {path.substr(0, dot), path.substr(dot + 1)};
}

std::shared_ptr<OperationRegistry> OperationRegistry::Global() {
  static const auto instance = std::make_shared<OperationRegistry>();
  return instance;
}

void OperationRegistry::Register(const std::string& path, OperationFn fn) {
  auto [module, attribute] = SplitOperationPath(path);
  if (module.empty() || attribute.empty()) {
    throw std::invalid_argument("operation path must look like <module>.<attribute>: '" + path + "'");
  }
  if (!fn) {
    throw std::invalid_argument("operation " + path + " has no implementation");
  }

  std::unique_lock lock(mutex_);
  modules_[module][attribute] = std::move(fn);
}

OperationFn OperationRegistry::Resolve(const std::string& path) const {
  const auto [module, attribute] = SplitOperationPath(path);

  std::shared_lock lock(mutex_);
  auto             module_it = modules_.find(module);
  if (module_it == modules_.end()) {
    throw util::NotFound("No module named " + module);
  }

  auto attribute_it = module_it->second.find(attribute);
  if (attribute_it == module_it->second.end()) {
    throw util::NotFound(module + " has no attribute '" + attribute + "'");
  }
  return attribute_it->second;
}

} // namespace localrun::dispatch
