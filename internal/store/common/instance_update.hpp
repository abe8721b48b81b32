#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>

#include "localrun/plan/v1/plan.pb.h"

namespace localrun::store::common {

/*
  Optimistic update rule shared by every backend. Callers hold the
  instance lock and persist the instance afterwards.

  Property-only updates must name the stored version, otherwise
  util::ConflictError is thrown and the instance is left untouched. State
  transitions are engine driven and always accepted.
*/
void ApplyInstanceUpdate(localrun::plan::v1::NodeInstance& instance, std::uint64_t expected_version,
                         const std::optional<google::protobuf::Struct>& runtime_properties,
                         const std::optional<std::string>&              state);

} // namespace localrun::store::common
