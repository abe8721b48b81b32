#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/store/file/file_instance_store.hpp"
#include "internal/store/memory/memory_instance_store.hpp"
#include "internal/util/errors.hpp"

namespace localrun::factory {

using observability::StringField;

store::InstanceStorePtr BuildInstanceStore(const localrun::runtime::config::StorageConfig& config, store::StoreSeed seed) {
  const auto& backend = config.backend();

  if (backend.empty() || backend == "memory") {
    return std::make_shared<store::memory::MemoryInstanceStore>(std::move(seed));
  }

  if (backend == "file") {
    std::filesystem::path storage_dir = config.file().storage_dir().empty() ? std::filesystem::path{store::file::FileInstanceStore::kDefaultStorageDir}
                                                                            : std::filesystem::path{config.file().storage_dir()};
    return std::make_shared<store::file::FileInstanceStore>(std::move(seed), std::move(storage_dir), config.file().clear());
  }

  throw util::ConfigurationError("invalid storage backend '" + backend + "' [expected memory or file]");
}

/*
    Build store + environment for one deployment
*/
dispatch::Environment BuildEnvironment(const localrun::runtime::config::RuntimeConfig& config, localrun::plan::v1::Plan plan,
                                       const std::filesystem::path& plan_path, std::shared_ptr<const dispatch::OperationResolver> resolver) {
  const std::string name = config.deployment().name().empty() ? kDefaultDeploymentName : config.deployment().name();

  std::filesystem::path resources_root = config.deployment().resources_root().empty()
                                             ? std::filesystem::absolute(plan_path).parent_path()
                                             : std::filesystem::path{config.deployment().resources_root()};

  if (!resolver) {
    throw std::invalid_argument("environment requires an operation resolver");
  }
  // Rejected wiring must not touch the backend (file storage clears or materializes on construction).
  dispatch::Environment::ValidatePlan(plan, *resolver);

  store::StoreSeed seed;
  seed.name           = name;
  seed.resources_root = std::move(resources_root);
  seed.nodes.assign(plan.nodes().begin(), plan.nodes().end());
  seed.node_instances.assign(plan.node_instances().begin(), plan.node_instances().end());

  auto storage = BuildInstanceStore(config.storage(), std::move(seed));

  LOCALRUN_LOG_INFO("Instance store built",
                    {StringField("deployment", name), StringField("backend", config.storage().backend().empty() ? "memory" : config.storage().backend())});

  return dispatch::Environment(name, std::move(plan), std::move(storage), std::move(resolver));
}

dispatch::ExecutionOptions ExecutionOptionsFrom(const localrun::runtime::config::ExecutionConfig& config) {
  dispatch::ExecutionOptions options;
  if (config.has_task_retries()) {
    options.task_retries = config.task_retries();
  }
  if (config.has_task_retry_interval_sec()) {
    options.task_retry_interval = std::chrono::seconds(config.task_retry_interval_sec());
  }
  if (config.has_thread_pool_size() && config.thread_pool_size() > 0) {
    options.task_thread_pool_size = config.thread_pool_size();
  }
  return options;
}

} // namespace localrun::factory
