#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/model/event_record.hpp"
#include "internal/dispatch/dispatch_result.hpp"

namespace causal::runtime::config {
class RuntimeConfig;
}

namespace causal::store {

// Caller input for one append. Unset payload/metadata become empty structs.
struct StoreRequest {
  std::string command;
  google::protobuf::Value payload;

  std::string actor;
  std::string origin;
  int32_t     version = 1;

  std::optional<std::string> correlation_id;
  std::optional<int64_t>     causation_id;

  google::protobuf::Value metadata;

  // defaults to now
  std::optional<uint64_t> timestamp_ms;
};

struct BulkEntry {
  db::model::EventRecord   row;
  dispatch::DispatchResult result;
};

struct PageRequest {
  uint64_t limit  = 100;
  uint64_t offset = 0;
};

struct Page {
  std::vector<db::model::EventRecord> events;
  uint64_t                            total_count = 0;
  bool                                has_more    = false;
  std::optional<uint64_t>             next_offset;
};

struct EventLineage {
  db::model::EventRecord                event;
  std::optional<db::model::EventRecord> parent;
  std::vector<db::model::EventRecord>   children;
};

// Ambient ids merged into a request by StoreWithContext. Set fields win.
struct EventContext {
  std::optional<std::string> correlation_id;
  std::optional<int64_t>     causation_id;
  google::protobuf::Value    metadata;
};

struct CacheStats {
  bool                      enabled  = false;
  size_t                    size     = 0;
  size_t                    max_size = 0;
  std::chrono::milliseconds ttl{0};
};

// id >= start, id < stop when stop is set
struct ReplayRange {
  int64_t                start = 0;
  std::optional<int64_t> stop;
};

struct ByCorrelation {
  std::string correlation_id;
};

struct ByActor {
  std::string actor;
};

struct ByCommand {
  std::string command;
};

using StreamFilter = std::variant<std::monostate, ByCorrelation, ByActor, ByCommand>;

struct StreamOptions {
  size_t  batch_size = 1000;
  int64_t start_id   = 0;
  // inclusive
  std::optional<int64_t> end_id;
  StreamFilter           filter;
};

enum class MissingParent {
  // fresh correlation id, warning logged
  kFallback,
  // ValidationError, nothing persisted
  kReject,
};

struct StoreOptions {
  bool                      cache_enabled       = true;
  size_t                    cache_max_size      = 1000;
  std::chrono::milliseconds cache_ttl           = std::chrono::minutes(5);
  bool                      invalidate_on_store = false;
  MissingParent             missing_parent      = MissingParent::kFallback;
  uint64_t                  page_size           = 1000;
  bool                      allow_reset         = false;

  static StoreOptions FromConfig(const causal::runtime::config::RuntimeConfig& config);
};

} // namespace causal::store
