#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/model/event_record.hpp"

namespace causal::lineage {

// Report subject: a correlation, or the correlation of one event.
struct ReportOptions {
  std::optional<std::string> correlation_id;
  std::optional<int64_t>     event_id;

  bool include_metrics       = true;
  bool include_relationships = true;
};

struct ChainLink {
  int64_t     id = 0;
  std::string command;
};

struct BranchPoint {
  ChainLink              event;
  std::vector<ChainLink> children;
};

struct Chain {
  int64_t                root_id = 0;
  std::vector<ChainLink> events;
};

struct ReportMetrics {
  uint64_t total_events    = 0;
  uint64_t root_events     = 0;
  uint64_t child_events    = 0;
  uint64_t unique_commands = 0;

  // first-seen order
  std::vector<std::pair<std::string, uint64_t>> command_distribution;

  // max id - min id
  int64_t  id_span      = 0;
  uint64_t time_span_ms = 0;

  double average_depth = 0;
};

struct ReportRelationships {
  // events with more than one child
  std::vector<BranchPoint> branch_points;
  // non-root events without children
  std::vector<ChainLink> leaf_events;
  // longest chain per root, only chains longer than one event
  std::vector<Chain> chains;
};

struct EventReport {
  std::string title;
  std::string generated_at;

  // set when the subject matched no events
  std::optional<std::string> error;

  std::vector<db::model::EventRecord> events;

  std::optional<ReportMetrics>       metrics;
  std::optional<ReportRelationships> relationships;
};

enum class ReportFormat {
  kText,
  kJson,
  kMarkdown,
};

// "text" | "json" | "markdown"; throws ValidationError otherwise.
ReportFormat ParseReportFormat(const std::string& name);

std::string RenderText(const EventReport& report);
std::string RenderJson(const EventReport& report);
std::string RenderMarkdown(const EventReport& report);
std::string Render(const EventReport& report, ReportFormat format);

// Metrics and relationships over one correlation's rows (ascending id).
// depths[i] is the causation depth of events[i].
ReportMetrics       ComputeMetrics(const std::vector<db::model::EventRecord>& events,
                                   const std::vector<uint32_t>&               depths);
ReportRelationships AnalyzeRelationships(const std::vector<db::model::EventRecord>& events);

// Box-drawing tree, one subtree per root of the correlation.
std::string RenderTree(const std::string& correlation_id, const std::vector<db::model::EventRecord>& events);

} // namespace causal::lineage
