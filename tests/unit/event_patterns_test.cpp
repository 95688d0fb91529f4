#include "internal/patterns/event_patterns.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using causal::patterns::CorrelationContext;
using causal::patterns::EventChainBuilder;
using causal::patterns::EventPatternQueries;
using causal::patterns::PatternedEventStore;
using causal::patterns::PatternOptions;
using causal::projection::EventMeta;
using causal::projection::Projection;
using causal::store::EventStore;
using causal::store::StoreRequest;
using google::protobuf::Value;

struct Fixture {
  EventStore          store{std::make_shared<causal::db::memory::MemoryRepository>(), {}, nullptr};
  Projection          echo{[](const Value& payload, const EventMeta&) { return payload; }};
  PatternedEventStore patterns;

  explicit Fixture(PatternOptions options = {}) : patterns(store, echo, options) {
  }
};

StoreRequest Request(const std::string& command, const std::string& metadata_json = "{}") {
  StoreRequest r;
  r.command  = command;
  r.payload  = causal::util::FromJson(R"({"k":1})");
  r.metadata = causal::util::FromJson(metadata_json);
  return r;
}

const Value& Meta(const causal::db::model::EventRecord& row, const std::string& key) {
  return row.metadata.struct_value().fields().at(key);
}

void TestExternalRejectsCausationAndTagsMetadata() {
  Fixture f;

  auto clicked = f.patterns.StoreExternal(Request("UserClicked", R"({"source":"web"})"));
  assert(clicked.id == 1);
  assert(clicked.correlation_id.size() == 36);
  assert(clicked.result);
  assert(Meta(clicked.event, "eventType").string_value() == "external");
  assert(Meta(clicked.event, "source").string_value() == "web");

  auto caused         = Request("UserSubmitted");
  caused.causation_id = clicked.id;
  bool threw          = false;
  try {
    (void)f.patterns.StoreExternal(caused);
  } catch (const causal::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(f.store.LastEvent()->id == 1);
}

void TestInternalRequiresAStoredParent() {
  Fixture f;
  auto    root = f.patterns.StoreExternal(Request("WebhookReceived"));

  bool threw = false;
  try {
    (void)f.patterns.StoreInternal(Request("ChargeCard"), std::nullopt);
  } catch (const causal::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)f.patterns.StoreInternal(Request("ChargeCard"), 99);
  } catch (const causal::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  auto charge = f.patterns.StoreInternal(Request("ChargeCard"), root.id);
  assert(charge.event.causation_id == root.id);
  assert(charge.correlation_id == root.correlation_id);
  assert(Meta(charge.event, "eventType").string_value() == "internal");
  assert(Meta(charge.event, "parentId").number_value() == root.id);

  // causation id on the request counts as the parent
  auto receipt         = Request("SendReceipt");
  receipt.causation_id = charge.id;
  auto sent            = f.patterns.StoreInternal(receipt, std::nullopt);
  assert(sent.event.causation_id == charge.id);
}

void TestRelaxedPatternsAllowRoots() {
  PatternOptions options;
  options.enforce_patterns       = false;
  options.validate_relationships = false;
  Fixture f(options);

  auto root = f.patterns.StoreInternal(Request("Housekeeping"), std::nullopt);
  assert(!root.event.causation_id.has_value());
  assert(Meta(root.event, "eventType").string_value() == "internal");
}

void TestBatchInternalTagsPositions() {
  Fixture f;
  auto    root = f.patterns.StoreExternal(Request("TimeReached"));

  auto batch = f.patterns.BatchInternal(root.id, {Request("Notify"), Request("Notify"), Request("Archive")});
  assert(batch.batch_id.size() == 36);
  assert(batch.events.size() == 3);
  for (size_t i = 0; i < batch.events.size(); ++i) {
    const auto& row = batch.events[i].event;
    assert(row.causation_id == root.id);
    assert(Meta(row, "batchId").string_value() == batch.batch_id);
    assert(Meta(row, "batchPosition").number_value() == static_cast<double>(i + 1));
    assert(Meta(row, "batchTotal").number_value() == 3);
  }
}

void TestChainLinksStepsAndFindsLeaves() {
  Fixture           f;
  EventChainBuilder chain(f.patterns);

  bool threw = false;
  try {
    chain.Then(Request("Orphan"));
  } catch (const causal::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  auto result = chain.StartWith(Request("UserSubmitted"))
                    .Then(Request("ValidateOrder"))
                    .ThenEach({Request("ReserveStock"), Request("ChargeCard")})
                    .Execute();

  assert(result.events.size() == 4);
  assert(result.Root().id == 1);
  assert(!result.Root().event.causation_id.has_value());
  assert(result.events[1].event.causation_id == result.events[0].id);
  assert(result.events[2].event.causation_id == result.events[1].id);
  assert(result.events[3].event.causation_id == result.events[1].id);
  assert((result.leaf_indices == std::vector<size_t>{2, 3}));
  for (const auto& e : result.events) assert(e.correlation_id == result.Root().correlation_id);
}

void TestSecondaryCorrelationsAreQueryable() {
  Fixture f;
  auto    root = f.patterns.StoreExternal(Request("MotionPassed"));

  CorrelationContext context("primary-corr");
  context.AddRule("42").AddUser("u7");

  auto tagged = f.patterns.StoreInternalWithContexts(Request("ApplyRule"), root.id, context);
  assert(tagged.correlation_id == "primary-corr");
  (void)f.patterns.StoreInternal(Request("Untagged"), root.id);

  EventPatternQueries queries(f.store);
  auto                by_rule = queries.FindBySecondaryCorrelation("ruleCorrelationId", "RULE-42-history");
  assert(by_rule.size() == 1 && by_rule[0].id == tagged.id);
  assert(queries.FindBySecondaryCorrelation("userCorrelationId", "USER-u7-activity").size() == 1);
  assert(queries.FindBySecondaryCorrelation("userCorrelationId", "USER-other-activity").empty());
}

void TestQueriesSplitExternalAndCaused() {
  Fixture f;
  auto    a = f.patterns.StoreExternal(Request("UserClicked"));
  auto    b = f.patterns.StoreExternal(Request("ApiCalled"));
  auto    c = f.patterns.StoreInternal(Request("Step"), a.id);
  auto    d = f.patterns.StoreInternal(Request("Step"), c.id);
  auto    e = f.patterns.StoreInternal(Request("Step"), d.id);

  EventPatternQueries queries(f.store);
  auto                externals = queries.FindExternalEvents();
  assert(externals.size() == 2 && externals[0].id == a.id && externals[1].id == b.id);

  causal::patterns::ExternalEventQuery by_command;
  by_command.command = "ApiCalled";
  assert(queries.FindExternalEvents(by_command).size() == 1);

  auto all = queries.FindCausedBy(a.id);
  assert(all.size() == 3);
  assert(all[0].id == c.id && all[1].id == d.id && all[2].id == e.id);

  assert(queries.FindCausedBy(a.id, false).size() == 1);
  assert(queries.FindCausedBy(a.id, true, 2).size() == 2);
  assert(queries.FindCausedBy(b.id).empty());
}

void TestExternalNamingHeuristic() {
  assert(PatternedEventStore::LooksLikeExternalEvent("UserClicked"));
  assert(PatternedEventStore::LooksLikeExternalEvent("webhookPing"));
  assert(PatternedEventStore::LooksLikeExternalEvent("PaymentReceived"));
  assert(!PatternedEventStore::LooksLikeExternalEvent("ChargeCard"));
  assert(!PatternedEventStore::LooksLikeExternalEvent(""));
}

} // namespace

int main() {
  TestExternalRejectsCausationAndTagsMetadata();
  TestInternalRequiresAStoredParent();
  TestRelaxedPatternsAllowRoots();
  TestBatchInternalTagsPositions();
  TestChainLinksStepsAndFindsLeaves();
  TestSecondaryCorrelationsAreQueryable();
  TestQueriesSplitExternalAndCaused();
  TestExternalNamingHeuristic();

  std::cout << "causal_store_unit_event_patterns: pass\n";
  return 0;
}
