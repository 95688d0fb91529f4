#include "internal/lineage/event_report.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/lineage/lineage_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using causal::db::model::EventRecord;
using causal::lineage::EventReport;
using causal::lineage::ReportFormat;
using causal::lineage::ReportOptions;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

EventRecord Event(int64_t id, const std::string& command, std::optional<int64_t> causation, uint64_t ts) {
  EventRecord e;
  e.id             = id;
  e.command        = command;
  e.actor          = "tester";
  e.origin         = "local";
  e.timestamp_ms   = ts;
  e.correlation_id = "r";
  e.causation_id   = causation;
  e.payload        = causal::util::EmptyStruct();
  e.metadata       = causal::util::EmptyStruct();
  return e;
}

// 1 Create -> {2 Update -> 4 Close, 3 Update}
std::vector<EventRecord> Sample() {
  return {Event(1, "Create", std::nullopt, 1000), Event(2, "Update", 1, 1500), Event(3, "Update", 1, 1600),
          Event(4, "Close", 2, 2000)};
}

std::shared_ptr<causal::db::memory::MemoryRepository> SeededRepo() {
  auto repo = std::make_shared<causal::db::memory::MemoryRepository>();
  for (auto e : Sample()) {
    auto tx = repo->Begin();
    assert(repo->InsertEvent(*tx, e));
    tx->Commit();
  }
  return repo;
}

void TestMetrics() {
  auto events = Sample();
  auto m      = causal::lineage::ComputeMetrics(events, {0, 1, 1, 2});

  assert(m.total_events == 4);
  assert(m.root_events == 1);
  assert(m.child_events == 3);
  assert(m.unique_commands == 3);
  assert(m.id_span == 3);
  assert(m.time_span_ms == 1000);
  assert(m.average_depth == 1.0);

  assert(m.command_distribution.size() == 3);
  assert(m.command_distribution[0].first == "Create");
  assert(m.command_distribution[1].first == "Update" && m.command_distribution[1].second == 2);
  assert(m.command_distribution[2].first == "Close");

  auto single = causal::lineage::ComputeMetrics({events[0]}, {0});
  assert(single.id_span == 0 && single.time_span_ms == 0);
}

void TestRelationships() {
  auto rel = causal::lineage::AnalyzeRelationships(Sample());

  assert(rel.branch_points.size() == 1);
  assert(rel.branch_points[0].event.id == 1);
  assert(rel.branch_points[0].children.size() == 2);
  assert(rel.branch_points[0].children[1].id == 3);

  assert(rel.leaf_events.size() == 2);
  assert(rel.leaf_events[0].id == 3 && rel.leaf_events[1].id == 4);

  assert(rel.chains.size() == 1);
  assert(rel.chains[0].root_id == 1);
  assert(rel.chains[0].events.size() == 3);
  assert(rel.chains[0].events[2].command == "Close");

  // a lone root forms no chain
  auto lone = causal::lineage::AnalyzeRelationships({Sample()[0]});
  assert(lone.chains.empty() && lone.leaf_events.empty());
}

EventReport Report() {
  causal::lineage::LineageQueryEngine engine(SeededRepo());
  ReportOptions                       options;
  options.correlation_id = "r";
  return engine.GenerateReport(options);
}

void TestTextReport() {
  auto report = Report();
  assert(!report.error.has_value());
  assert(report.title == "Event Report for Correlation ID: r");
  assert(report.metrics->average_depth == 1.0);

  auto text = causal::lineage::RenderText(report);
  assert(Contains(text, "Event Report for Correlation ID: r\n" + std::string(report.title.size(), '=') + "\n"));
  assert(Contains(text, "Total Events: 4\n"));
  assert(Contains(text, "Average Depth: 1.00\n"));
  assert(Contains(text, "Time Span: 3 event IDs (1000 ms)\n"));
  assert(Contains(text, "  Update: 2\n"));
  assert(Contains(text, "Branch Points: 1\n  Event 1 (Create) -> 2 children\n"));
  assert(Contains(text, "  3 events: 1(Create) -> 2(Update) -> 4(Close)\n"));
  assert(Contains(text, "Leaf Events: 2\n"));
  assert(Contains(text, "1: Create [ROOT]\n"));
  assert(Contains(text, "4: Close <- 2\n"));
}

void TestSectionsCanBeOmitted() {
  causal::lineage::LineageQueryEngine engine(SeededRepo());
  ReportOptions                       options;
  options.correlation_id        = "r";
  options.include_metrics       = false;
  options.include_relationships = false;

  auto report = engine.GenerateReport(options);
  assert(!report.metrics && !report.relationships);

  auto text = causal::lineage::RenderText(report);
  assert(!Contains(text, "METRICS"));
  assert(!Contains(text, "RELATIONSHIPS"));
  assert(Contains(text, "EVENTS\n------\n"));
}

void TestReportByEventId() {
  causal::lineage::LineageQueryEngine engine(SeededRepo());
  ReportOptions                       options;
  options.event_id = 4;

  auto report = engine.GenerateReport(options);
  assert(report.title == "Event Report for Event ID: 4 (Correlation: r)");
  assert(report.events.size() == 4);
}

void TestMarkdownReport() {
  auto md = causal::lineage::RenderMarkdown(Report());
  assert(md.rfind("# Event Report for Correlation ID: r\n\n", 0) == 0);
  assert(Contains(md, "## Metrics\n"));
  assert(Contains(md, "- **Average Depth:** 1.00\n"));
  assert(Contains(md, "- **Update:** 2\n"));
  assert(Contains(md, "- Event **1** (Create) branches to 2 children\n"));
  assert(Contains(md, "| 1 | Create | ✓ |  |\n"));
  assert(Contains(md, "| 4 | Close |  | 2 |\n"));
}

void TestJsonReport() {
  auto json = causal::lineage::RenderJson(Report());
  auto v    = causal::util::FromJson(json);

  const auto& f       = v.struct_value().fields();
  const auto& metrics = f.at("metrics").struct_value().fields();
  assert(metrics.at("totalEvents").number_value() == 4);
  assert(metrics.at("averageDepth").string_value() == "1.00");
  assert(metrics.at("eventTypeDistribution").struct_value().fields().at("Update").number_value() == 2);

  const auto& events = f.at("events").list_value().values();
  assert(events.size() == 4);
  assert(events[0].struct_value().fields().at("isRoot").bool_value());
  assert(events[0].struct_value().fields().at("causationId").has_null_value());
  assert(events[3].struct_value().fields().at("causationId").number_value() == 2);

  const auto& rel = f.at("relationships").struct_value().fields();
  assert(rel.at("chains").list_value().values(0).struct_value().fields().at("length").number_value() == 3);
  assert(rel.at("branchPoints").list_value().values(0).struct_value().fields().at("childCount").number_value() == 2);
  assert(rel.at("leafEvents").list_value().values_size() == 2);
}

void TestMissingSubjectRendersError() {
  causal::lineage::LineageQueryEngine engine(SeededRepo());
  ReportOptions                       options;
  options.correlation_id = "missing";

  auto report = engine.GenerateReport(options);
  assert(report.error == std::optional<std::string>("No events found"));
  assert(causal::lineage::RenderText(report) == "Error: No events found");
  assert(causal::lineage::RenderMarkdown(report) == "# Error\n\nNo events found");

  auto json = causal::util::FromJson(causal::lineage::RenderJson(report));
  assert(json.struct_value().fields().at("error").string_value() == "No events found");

  ReportOptions by_id;
  by_id.event_id = 404;
  assert(engine.GenerateReport(by_id).error.has_value());
}

void TestTree() {
  causal::lineage::LineageQueryEngine engine(SeededRepo());

  std::string rule;
  for (int i = 0; i < 50; ++i) rule += "═";

  const std::string expected = "Event Tree for Correlation ID: r\n" + rule +
                               "\n\n"
                               "└── [1] Create\n"
                               "    ├── [2] Update\n"
                               "    │   └── [4] Close\n"
                               "    └── [3] Update\n";
  assert(engine.GenerateEventTree("r") == expected);
  assert(engine.GenerateEventTree("x") == "No events found for correlation ID: x");
}

void TestParseReportFormat() {
  assert(causal::lineage::ParseReportFormat("text") == ReportFormat::kText);
  assert(causal::lineage::ParseReportFormat("json") == ReportFormat::kJson);
  assert(causal::lineage::ParseReportFormat("markdown") == ReportFormat::kMarkdown);
  assert(causal::lineage::ParseReportFormat("md") == ReportFormat::kMarkdown);

  bool threw = false;
  try {
    (void)causal::lineage::ParseReportFormat("xml");
  } catch (const causal::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  auto report = Report();
  assert(causal::lineage::Render(report, ReportFormat::kMarkdown) == causal::lineage::RenderMarkdown(report));
}

} // namespace

int main() {
  TestMetrics();
  TestRelationships();
  TestTextReport();
  TestSectionsCanBeOmitted();
  TestReportByEventId();
  TestMarkdownReport();
  TestJsonReport();
  TestMissingSubjectRendersError();
  TestTree();
  TestParseReportFormat();

  std::cout << "causal_store_unit_event_report: pass\n";
  return 0;
}
