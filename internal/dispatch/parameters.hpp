#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

#include "localrun/plan/v1/plan.pb.h"

namespace localrun::dispatch {

/*
  Merges caller parameters with the workflow's declared parameters.

    - declared without default: caller must supply it
    - declared with default:    caller value, else the default
    - not declared (custom):    passed through only when allowed

  Throws util::ValidationError naming every missing mandatory parameter, or
  every disallowed custom parameter, in sorted order.
*/
google::protobuf::Struct MergeAndValidateParameters(const localrun::plan::v1::WorkflowDef& workflow, const std::string& workflow_name,
                                                    const google::protobuf::Struct& execution_parameters, bool allow_custom_parameters);

} // namespace localrun::dispatch
