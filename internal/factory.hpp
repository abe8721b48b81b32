#pragma once

#include <filesystem>
#include <memory>

#include "config/config.pb.h"
#include "localrun/plan/v1/plan.pb.h"

#include "internal/dispatch/environment.hpp"
#include "internal/dispatch/execution_context.hpp"
#include "internal/dispatch/operation_registry.hpp"
#include "internal/store/api/instance_store.hpp"

namespace localrun::factory {

inline constexpr const char* kDefaultDeploymentName = "local";

/*
  BuildInstanceStore

  Selects the backend named by storage.backend ("memory" when empty, or
  "file"). Any other name is a util::ConfigurationError.
*/
store::InstanceStorePtr BuildInstanceStore(const localrun::runtime::config::StorageConfig& config, store::StoreSeed seed);

/*
  BuildEnvironment

  Constructs the instance store and the validated environment for a loaded
  plan. plan_path locates the blueprint directory used as resources root
  unless deployment.resources_root overrides it.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store types.
*/
dispatch::Environment BuildEnvironment(const localrun::runtime::config::RuntimeConfig& config, localrun::plan::v1::Plan plan,
                                       const std::filesystem::path&                      plan_path,
                                       std::shared_ptr<const dispatch::OperationResolver> resolver = dispatch::OperationRegistry::Global());

dispatch::ExecutionOptions ExecutionOptionsFrom(const localrun::runtime::config::ExecutionConfig& config);

} // namespace localrun::factory
