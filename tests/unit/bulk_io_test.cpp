#include "internal/store/bulk_io.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using causal::db::EventRepository;
using causal::db::model::EventRecord;
using causal::projection::EventMeta;
using causal::projection::Projection;
using causal::store::EventStore;
using causal::store::StoreRequest;
using google::protobuf::Value;

using RepoFactory = std::function<std::shared_ptr<EventRepository>()>;

std::shared_ptr<EventRepository> MemoryRepo() {
  return std::make_shared<causal::db::memory::MemoryRepository>();
}

std::shared_ptr<EventRepository> SqliteRepo() {
  auto repo = std::make_shared<causal::db::sqlite::SqliteRepository>(std::make_shared<causal::db::sqlite::SqliteDB>(":memory:"));
  repo->Bootstrap();
  return repo;
}

Projection Echo() {
  return Projection([](const Value& payload, const EventMeta&) { return payload; });
}

StoreRequest Request(const std::string& command, std::optional<int64_t> causation = std::nullopt) {
  StoreRequest r;
  r.command      = command;
  r.payload      = causal::util::FromJson(R"({"note":"a, \"quoted\" value"})");
  r.actor        = "alice";
  r.origin       = "10.0.0.1";
  r.causation_id = causation;
  r.timestamp_ms = 1000;
  return r;
}

std::unique_ptr<EventStore> NewStore(const RepoFactory& make) {
  return std::make_unique<EventStore>(make(), causal::store::StoreOptions{}, nullptr);
}

// 1 root -> 2 -> 3, 1 -> 4, plus an unrelated root 5
void Seed(EventStore& store) {
  auto echo = Echo();
  (void)store.Store(Request("Open"), echo);
  (void)store.Store(Request("Step", 1), echo);
  (void)store.Store(Request("Step", 2), echo);
  (void)store.Store(Request("Side", 1), echo);
  (void)store.Store(Request("Other"), echo);
}

void TestExportImportKeepsCausalShape(const RepoFactory& make) {
  auto source = NewStore(make);
  Seed(*source);

  std::stringstream jsonl;
  assert(causal::store::ExportJsonl(*source, jsonl) == 5);

  // target already holds an unrelated event, so every id shifts by one
  auto target = NewStore(make);
  (void)target->Store(Request("Existing"), Echo());

  causal::store::ImportOptions options;
  options.batch_size = 2;
  auto report        = causal::store::ImportJsonl(*target, jsonl, Echo(), causal::projection::Hooks::Void(), options);
  assert(report.imported == 5);
  assert(report.failed == 0);
  assert(report.id_map.size() == 5);
  for (const auto& [old_id, new_id] : report.id_map) assert(new_id == old_id + 1);

  auto step = target->RetrieveById(report.id_map.at(3));
  assert(step && step->command == "Step");
  assert(step->causation_id == report.id_map.at(2));
  assert(step->correlation_id == source->RetrieveById(3)->correlation_id);
  assert(step->timestamp_ms == 1000);
  assert(step->payload.struct_value().fields().at("note").string_value() == "a, \"quoted\" value");

  auto side = target->RetrieveById(report.id_map.at(4));
  assert(side->causation_id == report.id_map.at(1));
  assert(!target->RetrieveById(report.id_map.at(5))->causation_id.has_value());
}

void TestImportRejectsBadLinesUnlessSkipping() {
  const std::string input = R"({"command":"Good","payload":{"n":1}})"
                            "\n\n"
                            "not json\n"
                            R"({"payload":{"n":2}})"
                            "\n"
                            R"({"command":"ListPayload","payload":[1,2]})"
                            "\n"
                            R"({"command":"AlsoGood"})"
                            "\n";

  {
    auto              store = NewStore(MemoryRepo);
    std::stringstream in(input);
    bool              threw = false;
    try {
      (void)causal::store::ImportJsonl(*store, in, Echo());
    } catch (const causal::util::ValidationError& e) {
      threw = std::string(e.what()).find("line 3") != std::string::npos;
    }
    assert(threw);
  }

  auto              store = NewStore(MemoryRepo);
  std::stringstream in(input);
  causal::store::ImportOptions options;
  options.skip_errors = true;
  auto report         = causal::store::ImportJsonl(*store, in, Echo(), causal::projection::Hooks::Void(), options);
  assert(report.imported == 2);
  assert(report.failed == 3);
  assert(report.errors.size() == 3);
  assert(report.errors[0].line == 3 && report.errors[1].line == 4 && report.errors[2].line == 5);
  assert(store->LastEvent()->command == "AlsoGood");
}

void TestCsvEscapesFields() {
  auto store = NewStore(MemoryRepo);
  (void)store->Store(Request("Open"), Echo());

  std::stringstream csv;
  causal::store::ExportOptions options;
  options.include_metadata = false;
  assert(causal::store::ExportCsv(*store, csv, options) == 1);

  std::string header;
  std::string row;
  std::getline(csv, header);
  std::getline(csv, row);
  assert(header == "id,version,timestamp_ms,actor,origin,command,payload,correlation_id,causation_id");
  assert(row.rfind("1,1,1000,alice,10.0.0.1,Open,\"", 0) == 0);
  assert(row.find("\"\"note\"\"") != std::string::npos);
  // root: empty causation column last
  assert(row.back() == ',');
}

void TestBatchProcessCountsFailedBatches() {
  auto store = NewStore(MemoryRepo);
  Seed(*store);

  causal::store::StreamOptions options;
  options.batch_size = 2;

  std::vector<int64_t> seen;
  auto                 report = causal::store::BatchProcess(
      *store,
      [&](const std::vector<EventRecord>& batch) {
        if (batch.front().id == 3) throw std::runtime_error("projection offline");
        for (const auto& e : batch) seen.push_back(e.id);
      },
      options);

  assert(report.processed == 3);
  assert(report.failed == 2);
  assert(report.errors.size() == 1 && report.errors[0].message == "projection offline");
  assert((seen == std::vector<int64_t>{1, 2, 5}));
}

void TestProcessingStats() {
  auto store = NewStore(MemoryRepo);
  Seed(*store);

  auto stats = causal::store::GetProcessingStats(*store);
  assert(stats.total == 5);
  assert(stats.by_command.at("Step") == 2);
  assert(stats.by_actor.at("alice") == 5);
  assert(stats.by_version.at(1) == 5);
  assert(stats.roots == 2 && stats.children == 3);
  assert(stats.unique_correlations == 2);
  assert(stats.min_timestamp_ms == 1000 && stats.max_timestamp_ms == 1000);
}

} // namespace

int main() {
  TestExportImportKeepsCausalShape(MemoryRepo);
  TestExportImportKeepsCausalShape(SqliteRepo);
  TestImportRejectsBadLinesUnlessSkipping();
  TestCsvEscapesFields();
  TestBatchProcessCountsFailedBatches();
  TestProcessingStats();

  std::cout << "causal_store_unit_bulk_io: pass\n";
  return 0;
}
