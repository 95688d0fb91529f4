#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/query_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dispatch/dispatch_result.hpp"
#include "internal/projection/hooks.hpp"
#include "internal/projection/projection.hpp"
#include "internal/store/event_stream.hpp"
#include "internal/store/store_types.hpp"

namespace causal::store {

/*
  EventStore

  Append-only command log with causal bookkeeping.

  Write path:
    resolve correlation/causation -> insert (one tx) -> commit -> dispatch

  Correlation resolution:
    neither id       -> fresh UUID
    causation only   -> parent's correlation (looked up in the write tx)
    correlation set  -> kept as given

  Reads signal absence with std::nullopt. The cache is owned by the
  store; nullptr disables it.
*/

class EventStore {
 public:
  EventStore(std::shared_ptr<db::EventRepository> repository, StoreOptions options,
             std::unique_ptr<cache::QueryCache> cache);

  // ---------------------------------------------------------------------
  // Writes
  // ---------------------------------------------------------------------

  dispatch::DispatchResult Store(const StoreRequest& request, const projection::Projection& projection,
                                 const projection::Hooks& hooks = projection::Hooks::Void());

  // One transaction; throws BulkAbort (all rows rolled back) if any
  // request is invalid, ValidationError on empty input.
  std::vector<BulkEntry> StoreBulk(const std::vector<StoreRequest>& requests, const projection::Projection& projection,
                                   const projection::Hooks& hooks = projection::Hooks::Void());

  dispatch::DispatchResult StoreWithContext(const StoreRequest& request, const EventContext& context,
                                            const projection::Projection& projection,
                                            const projection::Hooks& hooks = projection::Hooks::Void());

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  std::optional<db::model::EventRecord> RetrieveById(int64_t id) const;
  std::optional<db::model::EventRecord> RetrieveByIdCached(int64_t id);

  std::vector<db::model::EventRecord> GetTransaction(const std::string& correlation_id) const;
  std::vector<db::model::EventRecord> GetTransactionCached(const std::string& correlation_id);

  std::vector<db::model::EventRecord> GetChildEvents(int64_t id) const;

  // Uncached filtered read, ascending id.
  std::vector<db::model::EventRecord> List(const db::EventFilter& filter) const;

  std::optional<EventLineage> GetEventLineage(int64_t id) const;

  std::optional<db::model::EventRecord> LastEvent() const;

  // ---------------------------------------------------------------------
  // Paginated reads
  // ---------------------------------------------------------------------

  Page GetByCorrelationIdPaginated(const std::string& correlation_id, const PageRequest& page = {}) const;
  Page GetChildEventsPaginated(int64_t id, const PageRequest& page = {}) const;
  Page GetEventsByActorPaginated(const std::string& actor, const PageRequest& page = {}) const;
  Page GetEventsByCommandPaginated(const std::string& command, const PageRequest& page = {}) const;
  Page GetEventsInTimeRangePaginated(uint64_t start_ms, uint64_t end_ms, const PageRequest& page = {}) const;

  // ---------------------------------------------------------------------
  // Replay
  // ---------------------------------------------------------------------

  void CycleThrough(const projection::Projection& projection, const std::function<void()>& on_done,
                    const projection::Hooks& hooks = projection::Hooks::Void(), const ReplayRange& range = {});

  EventStream StreamEvents(StreamOptions options = {}) const;

  // ---------------------------------------------------------------------
  // Cache / admin
  // ---------------------------------------------------------------------

  void       ClearCache();
  CacheStats GetCacheStats() const;

  // Drops every event. Throws InvalidState unless allow_reset is configured.
  void Reset();

  const StoreOptions& Options() const {
    return options_;
  }

 private:
  db::model::EventRecord BuildRecord(const StoreRequest& request) const;

  // Fills correlation_id per the resolution rules. Returns the rejection
  // reason when the missing-parent policy refuses the event.
  std::optional<std::string> ResolveCorrelation(db::Transaction& tx, db::model::EventRecord& row) const;

  Page Paginate(const db::EventFilter& filter, db::EventOrder order, const PageRequest& page) const;

  std::shared_ptr<db::EventRepository> repository_;
  StoreOptions                         options_;
  std::unique_ptr<cache::QueryCache>   cache_;
};

} // namespace causal::store
