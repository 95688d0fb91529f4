#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>

namespace causal::projection {

enum class ErrorKind {
  kValidation,
  kMigration,
  kHandler,
  kHook,
};

const char* ErrorKindName(ErrorKind kind);

/*
  Structured failure routed to Hooks::error and Projection::error.
  Carries the full event context so the receiver does not need a lookup.
  id is 0 when nothing was persisted.
*/
struct HandlerError {
  ErrorKind   kind = ErrorKind::kHandler;
  std::string message;
  // exception class, e.g. "ValidationError"
  std::string error;

  std::string             command;
  google::protobuf::Value payload;
  std::string             actor;
  std::string             origin;

  int64_t  id           = 0;
  int32_t  version      = 1;
  uint64_t timestamp_ms = 0;

  std::optional<std::string> correlation_id;
  std::optional<int64_t>     causation_id;
  google::protobuf::Value    metadata;
};

} // namespace causal::projection
