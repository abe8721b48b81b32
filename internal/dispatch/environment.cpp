#include "environment.hpp"

#include <optional>
#include <set>
#include <stdexcept>
#include <vector>

#include "internal/dispatch/functions.hpp"
#include "internal/dispatch/parameters.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/uuid.hpp"

namespace localrun::dispatch {

using localrun::plan::v1::NodeInstance;
using localrun::plan::v1::OperationDescriptor;
using observability::IntField;
using observability::StringField;

Environment::Environment(std::string name, localrun::plan::v1::Plan plan, std::shared_ptr<localrun::store::InstanceStore> storage,
                         std::shared_ptr<const OperationResolver> resolver)
    : name_(std::move(name)), plan_(std::move(plan)), storage_(std::move(storage)), resolver_(std::move(resolver)) {
  if (!storage_) {
    throw std::invalid_argument("environment requires an instance store");
  }
  if (!resolver_) {
    throw std::invalid_argument("environment requires an operation resolver");
  }

  ValidatePlan(plan_, *resolver_);

  LOCALRUN_LOG_INFO("Environment ready", {StringField("deployment", name_), IntField("nodes", plan_.nodes_size()),
                                          IntField("node_instances", plan_.node_instances_size()),
                                          IntField("workflows", static_cast<std::int64_t>(plan_.workflows().size()))});
}

namespace {

OperationFn ResolveMapped(const OperationResolver& resolver, const std::string& path, const std::string& type, const std::string& node_name) {
  try {
    return resolver.Resolve(path);
  } catch (const util::NotFound& e) {
    throw util::ConfigurationError("mapping error: " + std::string(e.what()) + " [node=" + node_name + ", type=" + type + "]");
  }
}

} // namespace

OperationFn Environment::ResolveOperation(const std::string& path, const std::string& type, const std::string& node_name) const {
  return ResolveMapped(*resolver_, path, type, node_name);
}

void Environment::ValidatePlan(const localrun::plan::v1::Plan& plan, const OperationResolver& resolver) {
  auto scan = [&resolver](const google::protobuf::Map<std::string, OperationDescriptor>& operations, const std::string& type,
                          const std::string& node_id) {
    for (const auto& [_, descriptor] : operations) {
      (void)ResolveMapped(resolver, descriptor.operation(), type, node_id);
    }
  };

  std::set<std::string> node_ids;
  for (const auto& node : plan.nodes()) {
    node_ids.insert(node.id());
    scan(node.operations(), "operations", node.id());
    for (const auto& relationship : node.relationships()) {
      scan(relationship.source_operations(), "source_operations", node.id());
      scan(relationship.target_operations(), "target_operations", node.id());
    }
  }

  for (const auto& instance : plan.node_instances()) {
    if (node_ids.count(instance.node_id()) == 0) {
      throw util::ConfigurationError("node instance " + instance.id() + " belongs to unknown node '" + instance.node_id() + "'");
    }
  }
}

google::protobuf::Struct Environment::Outputs() const {
  google::protobuf::Struct outputs = plan_.outputs();

  // Fetched on the first get_attribute and shared by the rest of the scan.
  std::optional<std::vector<NodeInstance>> instances;

  auto handler = [this, &instances](google::protobuf::Value& value, const std::string& path) {
    std::optional<GetAttribute> function;
    try {
      function = ParseGetAttribute(value);
    } catch (const util::ConfigurationError& e) {
      throw util::ConfigurationError(std::string(e.what()) + " [" + path + "]");
    }
    if (!function) {
      return false;
    }

    if (!instances) {
      instances = storage_->GetNodeInstances();
    }

    google::protobuf::Value attributes;
    auto*                   list = attributes.mutable_list_value();
    for (const auto& instance : *instances) {
      if (instance.node_id() != function->node_name) {
        continue;
      }
      const auto& runtime_properties = instance.runtime_properties().fields();
      auto        it                 = runtime_properties.find(function->attribute_name);
      if (it == runtime_properties.end()) {
        list->add_values()->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      } else {
        *list->add_values() = it->second;
      }
    }
    value = std::move(attributes);
    return true;
  };

  ScanProperties(outputs, handler, name_ + ".outputs");
  return outputs;
}

std::string Environment::Execute(const std::string& workflow_name, const google::protobuf::Struct& parameters, bool allow_custom_parameters,
                                 const ExecutionOptions& options) {
  const auto& workflows = plan_.workflows();
  auto        it        = workflows.find(workflow_name);
  if (it == workflows.end()) {
    std::set<std::string> existing;
    for (const auto& [name, _] : workflows) {
      existing.insert(name);
    }
    throw util::NotFound("'" + workflow_name + "' workflow does not exist. existing workflows are: " + util::Join(existing));
  }

  const auto& workflow        = it->second;
  auto        workflow_method = ResolveOperation(workflow.operation(), "workflow", "");

  const auto execution_id = util::ToString(util::GenerateUUID());

  auto merged_parameters = MergeAndValidateParameters(workflow, workflow_name, parameters, allow_custom_parameters);

  ExecutionContext ctx;
  ctx.local                       = true;
  ctx.deployment_id               = name_;
  ctx.blueprint_id                = name_;
  ctx.execution_id                = execution_id;
  ctx.workflow_id                 = workflow_name;
  ctx.storage                     = storage_;
  ctx.task_retries                = options.task_retries;
  ctx.task_retry_interval         = options.task_retry_interval;
  ctx.local_task_thread_pool_size = options.task_thread_pool_size;

  LOCALRUN_LOG_INFO("Starting workflow execution",
                    {StringField("deployment", name_), StringField("workflow", workflow_name), StringField("execution_id", execution_id)});

  try {
    workflow_method(ctx, merged_parameters);
  } catch (const std::exception& e) {
    LOCALRUN_LOG_ERROR("Workflow execution failed",
                       {StringField("workflow", workflow_name), StringField("execution_id", execution_id), StringField("error", e.what())});
    throw;
  }

  LOCALRUN_LOG_INFO("Finished workflow execution", {StringField("workflow", workflow_name), StringField("execution_id", execution_id)});
  return execution_id;
}

} // namespace localrun::dispatch
