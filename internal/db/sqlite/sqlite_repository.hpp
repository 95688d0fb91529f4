#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace causal::db::sqlite {

class SqliteRepository final : public db::EventRepository {
public:
  SqliteRepository(std::shared_ptr<SqliteDB> db, sql::IndexOptions indexes = {});

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

  // Creates the events table and the configured indices. Idempotent.
  void Bootstrap();

private:
  std::shared_ptr<SqliteDB> db_;
  sql::IndexOptions indexes_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  // Read helpers throw util::StorageError on prepare/step failure.
  static sqlite3_stmt* PrepareRead(sqlite3* db, const char* sql);
  static std::vector<model::EventRecord> ReadAll(sqlite3* db, sqlite3_stmt* st);
  static std::optional<model::EventRecord> ReadOne(sqlite3* db, sqlite3_stmt* st);
};

}
