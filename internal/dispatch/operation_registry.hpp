#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/dispatch/execution_context.hpp"

namespace localrun::dispatch {

/*
  Resolves "<module>.<attribute>" paths to callable implementations.

  Resolve throws util::NotFound naming either the missing module or the
  missing attribute, so callers can report the exact broken mapping.
*/
class OperationResolver {
 public:
  virtual ~OperationResolver() = default;

  virtual OperationFn Resolve(const std::string& path) const = 0;
};

// Splits at the last '.': {"a.b", "c"} for "a.b.c".
std::pair<std::string, std::string> SplitOperationPath(const std::string& path);

/*
  Registry the host fills with its operation and workflow implementations.
  Safe to register into and resolve from concurrently.
*/
class OperationRegistry final : public OperationResolver {
 public:
  // Process-wide registry.
  static std::shared_ptr<OperationRegistry> Global();

  void Register(const std::string& path, OperationFn fn);

  OperationFn Resolve(const std::string& path) const override;

 private:
  using Module = std::unordered_map<std::string, OperationFn>;

  mutable std::shared_mutex               mutex_;
  std::unordered_map<std::string, Module> modules_;
};

} // namespace localrun::dispatch
