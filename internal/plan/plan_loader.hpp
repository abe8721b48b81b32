#pragma once

#include <string>

#include "localrun/plan/v1/plan.pb.h"

namespace localrun::plan {

/*
  Loads a compiled deployment plan (YAML or JSON).

  The compiler emits more than this engine consumes, so unknown fields are
  ignored. Instances written with the compiler's "name" key instead of
  "node_id" are mapped onto node_id.
*/
class PlanLoader {
 public:
  static localrun::plan::v1::Plan LoadFromFile(const std::string& path);
};

} // namespace localrun::plan
