#include "internal/db/sqlite/sqlite_repository.hpp"

#include <sqlite3.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/factory.hpp"
#include "internal/store/event_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using causal::db::model::EventRecord;
using causal::db::sql::IndexOptions;
using causal::db::sqlite::SqliteDB;
using causal::db::sqlite::SqliteRepository;

std::set<std::string> IndexNames(SqliteDB& db) {
  std::set<std::string> names;
  auto* stmt = db.Prepare("SELECT name FROM sqlite_master WHERE type = 'index' AND name LIKE 'idx_%';");
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    names.insert(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
  }
  sqlite3_finalize(stmt);
  return names;
}

void TestBootstrapStatementsFollowOptions() {
  IndexOptions none;
  none.correlation_id = false;
  none.causation_id   = false;
  assert(causal::db::sql::BootstrapStatements(none).size() == 1);

  IndexOptions all;
  all.command             = true;
  all.actor               = true;
  all.timestamp           = true;
  all.version             = true;
  all.correlation_command = true;
  all.actor_timestamp     = true;
  assert(causal::db::sql::BootstrapStatements(all).size() == 9);
}

void TestDefaultIndicesAreCreated() {
  auto db   = std::make_shared<SqliteDB>(":memory:");
  auto repo = std::make_shared<SqliteRepository>(db);
  repo->Bootstrap();
  // idempotent
  repo->Bootstrap();

  auto names = IndexNames(*db);
  assert((names == std::set<std::string>{"idx_causation_id", "idx_correlation_id"}));
}

void TestOptionalIndicesAreCreated() {
  IndexOptions options;
  options.command         = true;
  options.actor_timestamp = true;

  auto db   = std::make_shared<SqliteDB>(":memory:");
  auto repo = std::make_shared<SqliteRepository>(db, options);
  repo->Bootstrap();

  auto names = IndexNames(*db);
  assert(names.count("idx_command") == 1);
  assert(names.count("idx_composite_actor_timestamp") == 1);
  assert(names.count("idx_actor") == 0);
}

void TestNullableColumnsRoundTrip() {
  auto db   = std::make_shared<SqliteDB>(":memory:");
  auto repo = std::make_shared<SqliteRepository>(db);
  repo->Bootstrap();

  EventRecord e;
  e.command      = "Anonymous";
  e.timestamp_ms = 42;
  e.payload      = causal::util::FromJson(R"({"nested":{"list":[1,"two",true,null]}})");

  auto tx = repo->Begin();
  assert(repo->InsertEvent(*tx, e));
  tx->Commit();
  assert(e.id == 1);

  auto read_tx = repo->BeginRead();
  auto read    = repo->GetEvent(*read_tx, 1);
  read_tx->Commit();

  assert(read.has_value());
  assert(!read->correlation_id.has_value());
  assert(!read->causation_id.has_value());
  assert(read->actor.empty());
  assert(read->metadata.has_struct_value());
  const auto& list = read->payload.struct_value().fields().at("nested").struct_value().fields().at("list").list_value();
  assert(list.values_size() == 4);
  assert(list.values(1).string_value() == "two");
  assert(list.values(3).has_null_value());
}

template <typename Fn>
bool ThrowsStorageError(Fn&& fn) {
  try {
    fn();
  } catch (const causal::util::StorageError&) {
    return true;
  }
  return false;
}

void TestCorruptRowIsAStorageErrorNotAbsence() {
  auto db   = std::make_shared<SqliteDB>(":memory:");
  auto repo = std::make_shared<SqliteRepository>(db);
  repo->Bootstrap();
  db->Exec("INSERT INTO events (version, timestamp, actor, origin, command, payload, correlation_id, metadata) "
           "VALUES (1, 5, 'a', 'o', 'Broken', 'not json', 'corr-broken', '{}');");

  {
    auto tx = repo->BeginRead();
    assert(ThrowsStorageError([&] { (void)repo->GetEvent(*tx, 1); }));
    assert(ThrowsStorageError([&] { (void)repo->GetLastEvent(*tx); }));
    assert(ThrowsStorageError([&] { (void)repo->ListEvents(*tx, {}, causal::db::EventOrder::kIdAscending, {}); }));
    // counting never decodes rows
    assert(repo->CountEvents(*tx, {}) == 1);
    tx->Commit();
  }
  // every statement was finalized on the throwing paths
  assert(sqlite3_next_stmt(db->Handle(), nullptr) == nullptr);

  // a broken parent is a fault, not a missing parent with a fresh correlation
  causal::store::EventStore store(repo, {}, nullptr);
  causal::projection::Projection echo(
      [](const google::protobuf::Value& payload, const causal::projection::EventMeta&) { return payload; });
  causal::store::StoreRequest child;
  child.command      = "Child";
  child.causation_id = 1;
  assert(ThrowsStorageError([&] { (void)store.Store(child, echo); }));

  auto tx = repo->BeginRead();
  assert(repo->CountEvents(*tx, {}) == 1);
  tx->Commit();
}

void TestFailedPrepareIsAStorageError() {
  auto db   = std::make_shared<SqliteDB>(":memory:");
  auto repo = std::make_shared<SqliteRepository>(db);
  repo->Bootstrap();
  db->Exec("DROP TABLE events;");

  auto tx = repo->BeginRead();
  assert(ThrowsStorageError([&] { (void)repo->GetEvent(*tx, 1); }));
  assert(ThrowsStorageError([&] { (void)repo->GetLastEvent(*tx); }));
  assert(ThrowsStorageError([&] { (void)repo->CountEvents(*tx, {}); }));
  assert(ThrowsStorageError([&] { (void)repo->ListOrphans(*tx); }));
  tx->Commit();
}

void TestNestedTransactionsBecomeSavepoints() {
  auto db   = std::make_shared<SqliteDB>(":memory:");
  auto repo = std::make_shared<SqliteRepository>(db);
  repo->Bootstrap();

  causal::db::sqlite::SqliteTransaction outer(db);
  assert(outer.Depth() == 0);
  {
    causal::db::sqlite::SqliteTransaction inner(db, causal::db::sqlite::SqliteTransaction::Mode::kRead);
    assert(inner.Depth() == 1);
    assert(!sqlite3_get_autocommit(db->Handle()));
    inner.Commit();
  }
  outer.Commit();
  assert(sqlite3_get_autocommit(db->Handle()));

  // depth is released after a commit so the next transaction is top-level again
  causal::db::sqlite::SqliteTransaction next(db);
  assert(next.Depth() == 0);
  next.Rollback();
}

void TestFactoryBuildsSqliteRuntime() {
  const auto path = (std::filesystem::temp_directory_path() /
                     ("causal_store_factory_" +
                      std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db"))
                        .string();

  auto config = causal::config::ConfigLoader::Defaults();
  config.mutable_database()->mutable_sqlite()->set_path(path);
  config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
  config.mutable_cache()->set_max_size(5);

  {
    auto runtime = causal::factory::Build(config);
    assert(runtime.repository && runtime.store && runtime.lineage);
    assert(runtime.store->GetCacheStats().max_size == 5);

    causal::projection::Projection echo(
        [](const google::protobuf::Value& payload, const causal::projection::EventMeta&) { return payload; });

    causal::store::StoreRequest root;
    root.command = "Open";
    auto first   = runtime.store->Store(root, echo);
    assert(first);

    causal::store::StoreRequest child;
    child.command      = "Close";
    child.causation_id = first.Row()->id;
    auto second        = runtime.store->Store(child, echo);
    assert(second);

    assert(runtime.lineage->GetEventDepth(second.Row()->id) == 1);
    assert(runtime.lineage->GetCriticalPath(*first.Row()->correlation_id)->Length() == 2);
  }

  {
    // reopened file keeps the log
    auto runtime = causal::factory::Build(config);
    assert(runtime.store->LastEvent()->command == "Close");
    assert(runtime.lineage->GetRootEvents().size() == 1);
  }

  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}

void TestFactoryDefaultsToMemory() {
  auto runtime = causal::factory::Build(causal::config::ConfigLoader::Defaults());
  assert(runtime.store->GetCacheStats().enabled);
  assert(!runtime.store->LastEvent().has_value());
}

} // namespace

int main() {
  TestBootstrapStatementsFollowOptions();
  TestDefaultIndicesAreCreated();
  TestOptionalIndicesAreCreated();
  TestNullableColumnsRoundTrip();
  TestCorruptRowIsAStorageErrorNotAbsence();
  TestFailedPrepareIsAStorageError();
  TestNestedTransactionsBecomeSavepoints();
  TestFactoryBuildsSqliteRuntime();
  TestFactoryDefaultsToMemory();

  std::cout << "causal_store_unit_sqlite_repository: pass\n";
  return 0;
}
