#include <google/protobuf/util/json_util.h>

#include <atomic>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/dispatch/execution_context.hpp"
#include "internal/dispatch/operation_registry.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/plan/plan_loader.hpp"
#include "internal/store/api/instance_store.hpp"
#include "internal/util/errors.hpp"
#include "localrun/v1.hpp"

namespace {

using localrun::dispatch::ExecutionContext;
using localrun::dispatch::OperationRegistry;
using localrun::observability::StringField;

std::string InstanceIdParameter(const google::protobuf::Struct& parameters) {
  auto it = parameters.fields().find("node_instance_id");
  if (it == parameters.fields().end()) {
    throw std::invalid_argument("operation requires node_instance_id");
  }
  return it->second.string_value();
}

// Reload-and-retry loop for property writes racing other workers.
void UpdateRuntimeProperties(const ExecutionContext& ctx, const std::string& node_instance_id,
                             const std::function<void(google::protobuf::Struct&)>& mutate) {
  for (int attempt = 0;; ++attempt) {
    auto instance   = ctx.storage->GetNodeInstance(node_instance_id);
    auto properties = instance.runtime_properties();
    mutate(properties);
    try {
      ctx.storage->UpdateNodeInstance(node_instance_id, instance.version(), properties, std::nullopt);
      return;
    } catch (const localrun::util::ConflictError&) {
      if (ctx.task_retries >= 0 && attempt >= ctx.task_retries) {
        throw;
      }
    }
  }
}

void SetState(const ExecutionContext& ctx, const std::string& node_instance_id, const std::string& state) {
  const auto instance = ctx.storage->GetNodeInstance(node_instance_id);
  ctx.storage->UpdateNodeInstance(node_instance_id, instance.version(), std::nullopt, state);
}

void RunOperation(const ExecutionContext& ctx, const localrun::v1::Node& node, const std::string& node_instance_id,
                  const std::string& operation) {
  auto it = node.operations().find(operation);
  if (it == node.operations().end()) {
    return;
  }
  google::protobuf::Struct parameters = it->second.inputs();
  (*parameters.mutable_fields())["node_instance_id"].set_string_value(node_instance_id);
  OperationRegistry::Global()->Resolve(it->second.operation())(ctx, parameters);
}

void RegisterDemoOperations() {
  auto registry = OperationRegistry::Global();

  registry->Register("demo.lifecycle.create", [](const ExecutionContext& ctx, const google::protobuf::Struct& parameters) {
    const auto id = InstanceIdParameter(parameters);
    UpdateRuntimeProperties(ctx, id, [&id](google::protobuf::Struct& properties) {
      (*properties.mutable_fields())["ip"].set_string_value("10.0.0." + std::to_string(std::hash<std::string>{}(id) % 250 + 2));
    });
  });

  registry->Register("demo.lifecycle.start", [](const ExecutionContext& ctx, const google::protobuf::Struct& parameters) {
    const auto id = InstanceIdParameter(parameters);
    LOCALRUN_LOG_INFO("Starting node instance", {StringField("node_instance_id", id), StringField("execution_id", ctx.execution_id)});
  });

  registry->Register("demo.relationships.connect", [](const ExecutionContext&, const google::protobuf::Struct&) {});

  // Creates and starts every instance on a pool of local_task_thread_pool_size workers.
  registry->Register("demo.workflows.install", [](const ExecutionContext& ctx, const google::protobuf::Struct& parameters) {
    const auto instances = ctx.storage->GetNodeInstances();
    const auto port      = parameters.fields().at("port");

    std::atomic<size_t>      next{0};
    std::mutex               errors_mutex;
    std::vector<std::string> errors;
    std::vector<std::thread> workers;

    auto work = [&]() {
      for (size_t i = next++; i < instances.size(); i = next++) {
        const auto& id = instances[i].id();
        try {
          const auto node = ctx.storage->GetNode(instances[i].node_id());
          SetState(ctx, id, "creating");
          RunOperation(ctx, node, id, "create");
          UpdateRuntimeProperties(ctx, id, [&port](google::protobuf::Struct& properties) { (*properties.mutable_fields())["port"] = port; });
          RunOperation(ctx, node, id, "start");
          SetState(ctx, id, "started");
        } catch (const std::exception& e) {
          std::lock_guard<std::mutex> lock(errors_mutex);
          errors.push_back(id + ": " + e.what());
        }
      }
    };

    for (std::uint32_t i = 0; i < ctx.local_task_thread_pool_size; ++i) {
      workers.emplace_back(work);
    }
    for (auto& worker : workers) {
      worker.join();
    }

    if (!errors.empty()) {
      throw std::runtime_error("install failed for " + std::to_string(errors.size()) + " node instance(s): " + errors.front());
    }
  });
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2 || argc > 4) {
    std::cerr << "Usage: local_install_example <plan.yaml> [config.yaml] [port]" << std::endl;
    return 1;
  }

  const std::string plan_path = argv[1];

  try {
    localrun::runtime::config::RuntimeConfig config;
    if (argc >= 3) {
      config = localrun::config::ConfigLoader::LoadFromYaml(argv[2]);
    }
    localrun::observability::InitializeLogging(config);

    RegisterDemoOperations();

    auto plan        = localrun::plan::PlanLoader::LoadFromFile(plan_path);
    auto environment = localrun::factory::BuildEnvironment(config, std::move(plan), plan_path);

    google::protobuf::Struct parameters;
    (*parameters.mutable_fields())["port"].set_number_value(argc == 4 ? std::stod(argv[3]) : 8080);

    environment.Execute("install", parameters, false, localrun::factory::ExecutionOptionsFrom(config.execution()));

    std::string outputs;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    auto status            = google::protobuf::util::MessageToJsonString(environment.Outputs(), &outputs, options);
    if (!status.ok()) {
      throw std::runtime_error("Failed to render outputs: " + std::string(status.message()));
    }
    std::cout << outputs << std::endl;
  } catch (const std::exception& e) {
    LOCALRUN_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    localrun::observability::ShutdownLogging();
    return 2;
  }

  localrun::observability::ShutdownLogging();
  return 0;
}
