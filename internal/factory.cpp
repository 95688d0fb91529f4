#include "factory.hpp"

#include <chrono>
#include <memory>

#include "internal/cache/query_cache.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"

namespace causal::factory {

using causal::observability::BoolField;
using causal::observability::IntField;
using causal::observability::StringField;

namespace {

std::shared_ptr<db::EventRepository> BuildRepository(const causal::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db),
                                                                     db::sql::IndexOptions::FromConfig(config.indexes()));
    repository->Bootstrap();
    CAUSAL_LOG_INFO("sqlite event log opened", {StringField("path", database.sqlite().path()),
                                                BoolField("wal", database.sqlite().wal_mode())});
    return repository;
  }

  CAUSAL_LOG_INFO("in-memory event log opened");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::unique_ptr<cache::QueryCache> BuildCache(const store::StoreOptions& options) {
  if (!options.cache_enabled) return nullptr;
  return std::make_unique<cache::QueryCache>(options.cache_max_size, options.cache_ttl);
}

} // namespace

/*
    Build full runtime dependency graph
*/
Runtime Build(const causal::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Write side
  // ------------------------------------------------------------------
  auto options  = store::StoreOptions::FromConfig(config);
  runtime.store = std::make_shared<store::EventStore>(runtime.repository, options, BuildCache(options));

  // ------------------------------------------------------------------
  // Read side
  // ------------------------------------------------------------------
  runtime.lineage = std::make_shared<lineage::LineageQueryEngine>(runtime.repository);

  CAUSAL_LOG_DEBUG("runtime built", {BoolField("cache", options.cache_enabled),
                                     IntField("cache_max_size", static_cast<int64_t>(options.cache_max_size)),
                                     IntField("replay_page_size", static_cast<int64_t>(options.page_size))});
  return runtime;
}

} // namespace causal::factory
