#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace causal::db::memory {

class MemoryTransaction;

/*
  In-process backend. Same contract as SqliteRepository; used when no
  database is configured and as the reference in parity tests.
*/
class MemoryRepository final : public db::EventRepository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertEvent(Transaction&, model::EventRecord&) override;

  std::optional<model::EventRecord> GetEvent(Transaction&, int64_t id) override;
  std::optional<model::EventRecord> GetLastEvent(Transaction&) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, const EventFilter&, EventOrder,
                                             const Pagination&) override;
  uint64_t CountEvents(Transaction&, const EventFilter&) override;
  std::vector<model::EventRecord> ListOrphans(Transaction&) override;

  Result Reset() override;

private:
  friend class MemoryTransaction;

  struct State {
    // ordered by id
    std::map<int64_t, model::EventRecord> events;
    int64_t next_id = 1;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
  // live transactions in open order; a new one on the same thread nests in the last
  std::vector<MemoryTransaction*> open_;
};

}
