#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/event_record.hpp"

namespace causal::db {

/*
  Event log repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - InsertEvent assigns the id and returns the stored row in one step;
    ids are strictly increasing and never reused
  - Rows are never updated; only Reset() removes them

  The causation_id and correlation_id lookups back the lineage engine.
*/

class EventRepository {
 public:
  virtual ~EventRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // write transaction
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // read-only snapshot; never blocks the writer
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Append
  // ---------------------------------------------------------------------

  // On success `record` holds the persisted row (id and stored payload).
  virtual Result InsertEvent(Transaction&, model::EventRecord& record) = 0;

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  virtual std::optional<model::EventRecord> GetEvent(Transaction&, int64_t id) = 0;

  virtual std::optional<model::EventRecord> GetLastEvent(Transaction&) = 0;

  virtual std::vector<model::EventRecord> ListEvents(Transaction&, const EventFilter& filter, EventOrder order,
                                                     const Pagination& pagination) = 0;

  virtual uint64_t CountEvents(Transaction&, const EventFilter& filter) = 0;

  // causation_id set but referencing no existing row, ascending id.
  virtual std::vector<model::EventRecord> ListOrphans(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Test-only
  // ---------------------------------------------------------------------

  // Drops and recreates the log. Id sequence restarts at 1.
  virtual Result Reset() = 0;
};

} // namespace causal::db
