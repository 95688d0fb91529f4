#pragma once

#include <stdexcept>
#include <string>

namespace causal::util {

/*
  Central error types.

  Store/query reads signal absence with std::optional, never NotFound.
  NotFound is for callers (causalctl) that need to report it.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by StoreBulk when any event in the batch is invalid. Nothing is persisted.
class BulkAbort : public std::runtime_error {
 public:
  explicit BulkAbort(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace causal::util
