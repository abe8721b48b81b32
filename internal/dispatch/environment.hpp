#pragma once

#include <google/protobuf/struct.pb.h>

#include <memory>
#include <string>

#include "internal/dispatch/execution_context.hpp"
#include "internal/dispatch/operation_registry.hpp"
#include "internal/store/api/instance_store.hpp"
#include "localrun/plan/v1/plan.pb.h"

namespace localrun::dispatch {

/*
  Local execution environment for one deployment.

  Construction resolves every operation mapping of every node (own
  operations plus both sides of each relationship) and checks that every
  instance belongs to a known node. Any failure throws
  util::ConfigurationError; a constructed Environment is always fully
  validated.
*/
class Environment {
 public:
  Environment(std::string name, localrun::plan::v1::Plan plan, std::shared_ptr<localrun::store::InstanceStore> storage,
              std::shared_ptr<const OperationResolver> resolver);

  // The construction-time wiring checks, runnable before any store exists.
  static void ValidatePlan(const localrun::plan::v1::Plan& plan, const OperationResolver& resolver);

  const std::string& Name() const {
    return name_;
  }

  const std::shared_ptr<localrun::store::InstanceStore>& Storage() const {
    return storage_;
  }

  const localrun::plan::v1::Plan& DeploymentPlan() const {
    return plan_;
  }

  // Plan outputs with every get_attribute expression replaced by the
  // attribute's current value on each instance of the named node.
  google::protobuf::Struct Outputs() const;

  /*
    Runs a workflow synchronously and returns its execution id.

    Throws util::NotFound for unknown workflows, util::ConfigurationError when
    the implementation cannot be resolved, util::ValidationError for rejected
    parameters. Errors raised by the implementation propagate unchanged.
  */
  std::string Execute(const std::string& workflow_name, const google::protobuf::Struct& parameters = {},
                      bool allow_custom_parameters = false, const ExecutionOptions& options = {});

 private:
  OperationFn ResolveOperation(const std::string& path, const std::string& type, const std::string& node_name) const;

  std::string                                     name_;
  localrun::plan::v1::Plan                        plan_;
  std::shared_ptr<localrun::store::InstanceStore> storage_;
  std::shared_ptr<const OperationResolver>        resolver_;
};

} // namespace localrun::dispatch
