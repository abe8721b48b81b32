#pragma once

#include <stdexcept>
#include <string>

namespace localrun::util {

/*
  Central error types.

  Every error here is surfaced to the immediate caller. ConflictError is the
  only one callers are expected to recover from (reload, then retry).
*/

// Unresolved operation mapping, invalid backend choice, malformed plan.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Stale expected version on a property update.
class ConflictError : public std::runtime_error {
 public:
  explicit ConflictError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Workflow parameters rejected. The message names every offending parameter.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace localrun::util
