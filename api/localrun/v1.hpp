#pragma once

#include "localrun/plan/v1/plan.pb.h"

namespace localrun::v1 {
using namespace ::localrun::plan::v1;
}
