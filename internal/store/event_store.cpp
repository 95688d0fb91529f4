#include "event_store.hpp"

#include <stdexcept>

#include "config/config.pb.h"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace causal::store {

using causal::observability::IntField;
using causal::observability::StringField;
using causal::projection::ErrorKind;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " (" + db::ErrorCodeName(result.code) + ")";
  if (!result.message.empty()) message += ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
      throw util::InvalidState(message);
    default:
      throw util::StorageError(message);
  }
}

google::protobuf::Value OrEmptyStruct(const google::protobuf::Value& value) {
  if (value.kind_case() != google::protobuf::Value::KIND_NOT_SET) return value;
  google::protobuf::Value empty;
  empty.mutable_struct_value();
  return empty;
}

// HandlerError for a request that never reached the log.
projection::HandlerError ValidationFailure(const StoreRequest& request, const std::string& message) {
  projection::HandlerError err;
  err.kind           = ErrorKind::kValidation;
  err.error          = "ValidationError";
  err.message        = message;
  err.command        = request.command;
  err.payload        = OrEmptyStruct(request.payload);
  err.actor          = request.actor;
  err.origin         = request.origin;
  err.version        = request.version;
  err.timestamp_ms   = request.timestamp_ms.value_or(0);
  err.correlation_id = request.correlation_id;
  err.causation_id   = request.causation_id;
  err.metadata       = OrEmptyStruct(request.metadata);
  return err;
}

} // namespace

StoreOptions StoreOptions::FromConfig(const causal::runtime::config::RuntimeConfig& config) {
  StoreOptions options;
  options.cache_enabled       = config.cache().enabled();
  options.cache_max_size      = static_cast<size_t>(config.cache().max_size());
  options.cache_ttl           = std::chrono::milliseconds(config.cache().ttl_ms());
  options.invalidate_on_store = config.cache().invalidate_on_store();
  options.missing_parent      = config.store().missing_parent() == causal::runtime::config::MISSING_PARENT_POLICY_REJECT
                                    ? MissingParent::kReject
                                    : MissingParent::kFallback;
  if (config.replay().page_size() > 0) options.page_size = config.replay().page_size();
  options.allow_reset = config.database().allow_reset();
  return options;
}

EventStore::EventStore(std::shared_ptr<db::EventRepository> repository, StoreOptions options,
                       std::unique_ptr<cache::QueryCache> cache)
    : repository_(std::move(repository)), options_(std::move(options)), cache_(std::move(cache)) {
  if (!repository_) {
    throw std::invalid_argument("event store requires a repository");
  }
}

// ------------------------------------------------------------
// Record building / correlation
// ------------------------------------------------------------

db::model::EventRecord EventStore::BuildRecord(const StoreRequest& request) const {
  db::model::EventRecord row;
  row.version        = request.version;
  row.timestamp_ms   = request.timestamp_ms.value_or(util::NowMillis());
  row.actor          = request.actor;
  row.origin         = request.origin;
  row.command        = request.command;
  row.payload        = OrEmptyStruct(request.payload);
  row.correlation_id = request.correlation_id;
  row.causation_id   = request.causation_id;
  row.metadata       = OrEmptyStruct(request.metadata);
  return row;
}

std::optional<std::string> EventStore::ResolveCorrelation(db::Transaction& tx, db::model::EventRecord& row) const {
  if (row.correlation_id) return std::nullopt;

  if (!row.causation_id) {
    row.correlation_id = util::NewCorrelationId();
    return std::nullopt;
  }

  auto parent = repository_->GetEvent(tx, *row.causation_id);
  if (parent && parent->correlation_id) {
    row.correlation_id = parent->correlation_id;
    return std::nullopt;
  }

  if (options_.missing_parent == MissingParent::kReject) {
    return "causation_id " + std::to_string(*row.causation_id) + " does not reference a stored event";
  }

  row.correlation_id = util::NewCorrelationId();
  CAUSAL_LOG_WARN("causation parent missing; generated fresh correlation",
                  {StringField("command", row.command), IntField("causation_id", *row.causation_id),
                   StringField("correlation_id", *row.correlation_id)});
  return std::nullopt;
}

// ------------------------------------------------------------
// Store
// ------------------------------------------------------------

dispatch::DispatchResult EventStore::Store(const StoreRequest& request, const projection::Projection& projection,
                                           const projection::Hooks& hooks) {
  if (request.command.empty()) {
    auto err = ValidationFailure(request, "No command given; aborting");
    dispatch::Dispatcher::Report(err, nullptr, hooks);
    return dispatch::DispatchResult::Err(std::move(err));
  }

  auto row = BuildRecord(request);
  auto tx  = repository_->Begin();

  if (auto rejected = ResolveCorrelation(*tx, row)) {
    tx->Rollback();
    auto err = ValidationFailure(request, *rejected);
    dispatch::Dispatcher::Report(err, nullptr, hooks);
    return dispatch::DispatchResult::Err(std::move(err));
  }

  ThrowIfDbError(repository_->InsertEvent(*tx, row), "store event");
  tx->Commit();

  if (cache_ && options_.invalidate_on_store) cache_->Clear();

  return dispatch::Dispatcher::Execute(row, projection, hooks);
}

std::vector<BulkEntry> EventStore::StoreBulk(const std::vector<StoreRequest>& requests,
                                             const projection::Projection& projection, const projection::Hooks& hooks) {
  if (requests.empty()) {
    throw util::ValidationError("store bulk: events must be a non-empty list");
  }

  std::vector<BulkEntry> entries;
  entries.reserve(requests.size());

  // Handlers run inside the batch transaction; store reads they make nest
  // in it and see the rows inserted so far.
  auto tx = repository_->Begin();
  try {
    for (size_t i = 0; i < requests.size(); ++i) {
      const auto& request = requests[i];
      if (request.command.empty()) {
        throw util::BulkAbort("store bulk: no command given for event " + std::to_string(i) + "; aborting bulk insert");
      }

      auto row = BuildRecord(request);
      if (auto rejected = ResolveCorrelation(*tx, row)) {
        throw util::BulkAbort("store bulk: event " + std::to_string(i) + ": " + *rejected);
      }
      ThrowIfDbError(repository_->InsertEvent(*tx, row), "store bulk");

      auto result = dispatch::Dispatcher::Execute(row, projection, hooks);
      entries.push_back(BulkEntry{std::move(row), std::move(result)});
    }
    tx->Commit();
  } catch (const std::exception&) {
    // a handler may have cached rows that are now rolled back
    if (cache_) cache_->Clear();
    throw;
  }

  if (cache_) cache_->Clear();

  CAUSAL_LOG_INFO("bulk store committed", {IntField("events", static_cast<int64_t>(entries.size())),
                                           IntField("first_id", entries.front().row.id),
                                           IntField("last_id", entries.back().row.id)});
  return entries;
}

dispatch::DispatchResult EventStore::StoreWithContext(const StoreRequest& request, const EventContext& context,
                                                      const projection::Projection& projection,
                                                      const projection::Hooks& hooks) {
  StoreRequest enriched = request;
  if (context.correlation_id) enriched.correlation_id = context.correlation_id;
  if (context.causation_id) enriched.causation_id = context.causation_id;

  auto merged = OrEmptyStruct(request.metadata);
  if (context.metadata.has_struct_value()) {
    if (!merged.has_struct_value()) merged = OrEmptyStruct({});
    for (const auto& [key, value] : context.metadata.struct_value().fields()) {
      (*merged.mutable_struct_value()->mutable_fields())[key] = value;
    }
  }
  enriched.metadata = std::move(merged);

  return Store(enriched, projection, hooks);
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::vector<db::model::EventRecord> EventStore::List(const db::EventFilter& filter) const {
  auto tx   = repository_->BeginRead();
  auto rows = repository_->ListEvents(*tx, filter, db::EventOrder::kIdAscending, {});
  tx->Commit();
  return rows;
}

std::optional<db::model::EventRecord> EventStore::RetrieveById(int64_t id) const {
  auto tx  = repository_->BeginRead();
  auto row = repository_->GetEvent(*tx, id);
  tx->Commit();
  return row;
}

std::optional<db::model::EventRecord> EventStore::RetrieveByIdCached(int64_t id) {
  if (!cache_) return RetrieveById(id);

  const auto key = cache::QueryCache::ByIdKey(id);
  if (auto hit = cache_->Get(key); hit && !hit->empty()) {
    return hit->front();
  }

  auto row = RetrieveById(id);
  // absence is not cached so a later insert is visible
  if (row) cache_->Put(key, {*row});
  return row;
}

std::vector<db::model::EventRecord> EventStore::GetTransaction(const std::string& correlation_id) const {
  db::EventFilter filter;
  filter.correlation_id = correlation_id;
  return List(filter);
}

std::vector<db::model::EventRecord> EventStore::GetTransactionCached(const std::string& correlation_id) {
  if (!cache_) return GetTransaction(correlation_id);

  const auto key = cache::QueryCache::TransactionKey(correlation_id);
  if (auto hit = cache_->Get(key)) return *hit;

  auto rows = GetTransaction(correlation_id);
  cache_->Put(key, rows);
  return rows;
}

std::vector<db::model::EventRecord> EventStore::GetChildEvents(int64_t id) const {
  db::EventFilter filter;
  filter.causation_id = id;
  return List(filter);
}

std::optional<EventLineage> EventStore::GetEventLineage(int64_t id) const {
  auto tx    = repository_->BeginRead();
  auto event = repository_->GetEvent(*tx, id);
  if (!event) {
    tx->Commit();
    return std::nullopt;
  }

  EventLineage lineage;
  lineage.event = *event;
  if (event->causation_id) {
    lineage.parent = repository_->GetEvent(*tx, *event->causation_id);
  }

  db::EventFilter children;
  children.causation_id = id;
  lineage.children      = repository_->ListEvents(*tx, children, db::EventOrder::kIdAscending, {});
  tx->Commit();
  return lineage;
}

std::optional<db::model::EventRecord> EventStore::LastEvent() const {
  auto tx  = repository_->BeginRead();
  auto row = repository_->GetLastEvent(*tx);
  tx->Commit();
  return row;
}

// ------------------------------------------------------------
// Pagination
// ------------------------------------------------------------

Page EventStore::Paginate(const db::EventFilter& filter, db::EventOrder order, const PageRequest& request) const {
  if (request.limit == 0) {
    throw util::ValidationError("pagination: limit must be positive");
  }

  db::Pagination pagination;
  pagination.limit  = request.limit;
  pagination.offset = request.offset;

  Page page;
  auto tx           = repository_->BeginRead();
  page.events       = repository_->ListEvents(*tx, filter, order, pagination);
  page.total_count  = repository_->CountEvents(*tx, filter);
  tx->Commit();

  const auto next = request.offset + request.limit;
  page.has_more   = next < page.total_count;
  if (page.has_more) page.next_offset = next;
  return page;
}

Page EventStore::GetByCorrelationIdPaginated(const std::string& correlation_id, const PageRequest& page) const {
  db::EventFilter filter;
  filter.correlation_id = correlation_id;
  return Paginate(filter, db::EventOrder::kIdAscending, page);
}

Page EventStore::GetChildEventsPaginated(int64_t id, const PageRequest& page) const {
  db::EventFilter filter;
  filter.causation_id = id;
  return Paginate(filter, db::EventOrder::kIdAscending, page);
}

Page EventStore::GetEventsByActorPaginated(const std::string& actor, const PageRequest& page) const {
  db::EventFilter filter;
  filter.actor = actor;
  return Paginate(filter, db::EventOrder::kNewestFirst, page);
}

Page EventStore::GetEventsByCommandPaginated(const std::string& command, const PageRequest& page) const {
  db::EventFilter filter;
  filter.command = command;
  return Paginate(filter, db::EventOrder::kNewestFirst, page);
}

Page EventStore::GetEventsInTimeRangePaginated(uint64_t start_ms, uint64_t end_ms, const PageRequest& page) const {
  db::EventFilter filter;
  filter.min_timestamp_ms = start_ms;
  filter.max_timestamp_ms = end_ms;
  return Paginate(filter, db::EventOrder::kNewestFirst, page);
}

// ------------------------------------------------------------
// Replay
// ------------------------------------------------------------

void EventStore::CycleThrough(const projection::Projection& projection, const std::function<void()>& on_done,
                              const projection::Hooks& hooks, const ReplayRange& range) {
  // stop is exclusive; an empty range still reports completion
  if (range.stop && *range.stop <= range.start) {
    CAUSAL_LOG_INFO("replay complete", {IntField("start", range.start), IntField("events", 0)});
    if (on_done) on_done();
    return;
  }

  db::EventFilter filter;
  filter.min_id = range.start;
  if (range.stop) filter.max_id = *range.stop - 1;

  db::Pagination pagination;
  pagination.limit = options_.page_size;

  uint64_t dispatched = 0;
  uint64_t failed     = 0;
  while (true) {
    // page read is closed before dispatch so handlers may read the store
    std::vector<db::model::EventRecord> rows;
    {
      auto tx = repository_->BeginRead();
      rows    = repository_->ListEvents(*tx, filter, db::EventOrder::kIdAscending, pagination);
      tx->Commit();
    }
    if (rows.empty()) break;

    for (const auto& row : rows) {
      if (!dispatch::Dispatcher::Execute(row, projection, hooks)) failed++;
      dispatched++;
    }
    filter.min_id = rows.back().id + 1;
  }

  CAUSAL_LOG_INFO("replay complete", {IntField("start", range.start), IntField("events", static_cast<int64_t>(dispatched)),
                                      IntField("failed", static_cast<int64_t>(failed))});
  if (on_done) on_done();
}

EventStream EventStore::StreamEvents(StreamOptions options) const {
  return EventStream(repository_, std::move(options));
}

// ------------------------------------------------------------
// Cache / admin
// ------------------------------------------------------------

void EventStore::ClearCache() {
  if (cache_) cache_->Clear();
}

CacheStats EventStore::GetCacheStats() const {
  CacheStats stats;
  if (!cache_) return stats;

  stats.enabled  = true;
  stats.size     = cache_->Size();
  stats.max_size = cache_->MaxSize();
  stats.ttl      = cache_->Ttl();
  return stats;
}

void EventStore::Reset() {
  if (!options_.allow_reset) {
    throw util::InvalidState("reset: not allowed; set database.allow_reset for test stores");
  }

  ThrowIfDbError(repository_->Reset(), "reset");
  ClearCache();
  CAUSAL_LOG_WARN("event log reset");
}

} // namespace causal::store
