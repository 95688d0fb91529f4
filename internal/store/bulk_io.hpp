#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "internal/projection/hooks.hpp"
#include "internal/projection/projection.hpp"
#include "internal/store/event_store.hpp"

namespace causal::store {

/*
  Bulk export/import and batch processing over EventStream.

  JSONL lines carry every column:
    {"id":..,"version":..,"timestamp_ms":..,"actor":..,"origin":..,
     "command":..,"payload":{..},"correlation_id":..|null,
     "causation_id":..|null,"metadata":{..}}
*/

struct ExportOptions {
  StreamOptions stream;
  bool          include_metadata = true;
  // CSV only
  bool include_headers = true;
};

// Returns the number of events written.
uint64_t ExportJsonl(const EventStore& store, std::ostream& out, const ExportOptions& options = {});
uint64_t ExportCsv(const EventStore& store, std::ostream& out, const ExportOptions& options = {});

// line is 0 for failures that are not tied to one input line
struct BulkError {
  uint64_t    line = 0;
  std::string message;
};

struct ImportOptions {
  size_t batch_size = 100;
  // command required, payload and metadata must be objects
  bool validate = true;
  // record bad lines / aborted batches instead of throwing
  bool skip_errors = false;
};

struct ImportReport {
  uint64_t imported = 0;
  uint64_t failed   = 0;
  // first kMaxErrors only
  std::vector<BulkError> errors;
  // exported id -> id assigned on import
  std::map<int64_t, int64_t> id_map;

  static constexpr size_t kMaxErrors = 100;
};

/*
  Appends the events of a JSONL export through StoreBulk.

  Ids are reassigned. A causation id naming an event imported earlier in
  the same run is rewritten to that event's new id; any other causation
  id is kept as written. Correlation ids and timestamps are kept.
  Without skip_errors a bad line throws ValidationError and an aborted
  batch rethrows BulkAbort; batches already stored stay stored.
*/
ImportReport ImportJsonl(EventStore& store, std::istream& in, const projection::Projection& projection,
                         const projection::Hooks& hooks = projection::Hooks::Void(), const ImportOptions& options = {});

struct BatchReport {
  uint64_t               processed = 0;
  uint64_t               failed    = 0;
  std::vector<BulkError> errors;
};

// Runs fn on each stream batch. A throwing batch is counted as failed and processing continues.
BatchReport BatchProcess(const EventStore& store,
                         const std::function<void(const std::vector<db::model::EventRecord>&)>& fn,
                         StreamOptions options = {});

struct ProcessingStats {
  uint64_t                          total = 0;
  std::map<std::string, uint64_t>   by_command;
  std::map<std::string, uint64_t>   by_actor;
  std::map<int32_t, uint64_t>       by_version;
  std::optional<uint64_t>           min_timestamp_ms;
  std::optional<uint64_t>           max_timestamp_ms;
  uint64_t                          unique_correlations = 0;
  uint64_t                          roots               = 0;
  uint64_t                          children            = 0;
};

ProcessingStats GetProcessingStats(const EventStore& store, StreamOptions options = {});

} // namespace causal::store
