#include "parameters.hpp"

#include <set>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace localrun::dispatch {

google::protobuf::Struct MergeAndValidateParameters(const localrun::plan::v1::WorkflowDef& workflow, const std::string& workflow_name,
                                                    const google::protobuf::Struct& execution_parameters, bool allow_custom_parameters) {
  const auto& declared = workflow.parameters();
  const auto& supplied = execution_parameters.fields();

  google::protobuf::Struct merged;
  auto&                    merged_fields = *merged.mutable_fields();

  std::set<std::string> missing_mandatory;
  for (const auto& [name, parameter] : declared) {
    auto it = supplied.find(name);
    if (it != supplied.end()) {
      merged_fields[name] = it->second;
    } else if (parameter.has_default_value()) {
      merged_fields[name] = parameter.default_value();
    } else {
      missing_mandatory.insert(name);
    }
  }

  if (!missing_mandatory.empty()) {
    throw util::ValidationError("Workflow \"" + workflow_name + "\" must be provided with the following parameters to execute: " +
                                util::Join(missing_mandatory));
  }

  std::set<std::string> custom;
  for (const auto& [name, _] : supplied) {
    if (declared.find(name) == declared.end()) {
      custom.insert(name);
    }
  }

  if (!custom.empty() && !allow_custom_parameters) {
    throw util::ValidationError("Workflow \"" + workflow_name + "\" does not have the following parameters declared: " + util::Join(custom) +
                                ". Remove these parameters or use the flag for allowing custom parameters");
  }

  for (const auto& name : custom) {
    merged_fields[name] = supplied.at(name);
  }
  return merged;
}

} // namespace localrun::dispatch
