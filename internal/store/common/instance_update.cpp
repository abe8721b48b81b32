#include "instance_update.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace localrun::store::common {

using observability::IntField;
using observability::StringField;

void ApplyInstanceUpdate(localrun::plan::v1::NodeInstance& instance, std::uint64_t expected_version,
                         const std::optional<google::protobuf::Struct>& runtime_properties,
                         const std::optional<std::string>&              state) {
  if (!state && expected_version != instance.version()) {
    // Expected during concurrent property writes; the caller reloads and retries.
    LOCALRUN_LOG_DEBUG("Rejected stale node instance update",
                       {StringField("node_instance_id", instance.id()), IntField("expected_version", static_cast<std::int64_t>(expected_version)),
                        IntField("current_version", static_cast<std::int64_t>(instance.version()))});
    throw util::ConflictError("version " + std::to_string(expected_version) + " does not match current version of node instance " +
                              instance.id() + " which is " + std::to_string(instance.version()));
  }

  instance.set_version(instance.version() + 1);
  if (runtime_properties) {
    *instance.mutable_runtime_properties() = *runtime_properties;
  }
  if (state) {
    instance.set_state(*state);
  }
}

} // namespace localrun::store::common
