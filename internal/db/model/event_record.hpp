#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>

namespace causal::db::model {

/*
  One row of the append-only event log.

  id is assigned by the backend at insert time and never changes.
  payload/metadata are opaque to the store:
    sqlite -> JSON text
    memory -> google::protobuf::Value
*/

struct EventRecord {
  int64_t id      = 0;
  int32_t version = 1;

  // epoch ms
  uint64_t timestamp_ms = 0;

  std::string actor;
  std::string origin;
  std::string command;

  google::protobuf::Value payload;

  std::optional<std::string> correlation_id;

  // absent for root (externally originated) events
  std::optional<int64_t> causation_id;

  google::protobuf::Value metadata;

  bool IsRoot() const {
    return !causation_id.has_value();
  }
};

} // namespace causal::db::model
