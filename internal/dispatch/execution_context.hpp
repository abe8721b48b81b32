#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace localrun::store { class InstanceStore; }

namespace localrun::dispatch {

/*
  Retry and worker pool settings handed through to the workflow
  implementation. The engine itself does not interpret them.
*/
struct ExecutionOptions {
  // -1 retries forever.
  int                  task_retries = -1;
  std::chrono::seconds task_retry_interval{30};
  std::uint32_t        task_thread_pool_size = 1;
};

/*
  Everything a workflow or operation implementation gets from the engine.
*/
struct ExecutionContext {
  bool                                            local = true;
  std::string                                     deployment_id;
  std::string                                     blueprint_id;
  std::string                                     execution_id;
  std::string                                     workflow_id;
  std::shared_ptr<localrun::store::InstanceStore> storage;
  int                                             task_retries = -1;
  std::chrono::seconds                            task_retry_interval{30};
  std::uint32_t                                   local_task_thread_pool_size = 1;
};

using OperationFn = std::function<void(const ExecutionContext&, const google::protobuf::Struct& parameters)>;

} // namespace localrun::dispatch
