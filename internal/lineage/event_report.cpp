#include "event_report.hpp"

#include <google/protobuf/struct.pb.h>

#include <algorithm>
#include <cstdio>
#include <functional>
#include <map>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace causal::lineage {

using db::model::EventRecord;

namespace {

std::string FormatDepth(double depth) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", depth);
  return buf;
}

std::string Repeat(const std::string& s, size_t n) {
  std::string out;
  out.reserve(s.size() * n);
  for (size_t i = 0; i < n; ++i) out += s;
  return out;
}

std::unordered_map<int64_t, std::vector<const EventRecord*>> ChildrenOf(const std::vector<EventRecord>& events) {
  std::unordered_map<int64_t, std::vector<const EventRecord*>> children;
  for (const auto& e : events)
    if (e.causation_id) children[*e.causation_id].push_back(&e);
  return children;
}

// ------------------------------------------------------------
// Struct builders for the JSON form
// ------------------------------------------------------------

google::protobuf::Value Num(double n) {
  google::protobuf::Value v;
  v.set_number_value(n);
  return v;
}

google::protobuf::Value Str(const std::string& s) {
  google::protobuf::Value v;
  v.set_string_value(s);
  return v;
}

google::protobuf::Value Bool(bool b) {
  google::protobuf::Value v;
  v.set_bool_value(b);
  return v;
}

google::protobuf::Value Null() {
  google::protobuf::Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

google::protobuf::Value Link(const ChainLink& link) {
  google::protobuf::Value v;
  auto&                   f = *v.mutable_struct_value()->mutable_fields();
  f["id"]                   = Num(static_cast<double>(link.id));
  f["command"]              = Str(link.command);
  return v;
}

google::protobuf::Value Links(const std::vector<ChainLink>& links) {
  google::protobuf::Value v;
  auto*                   list = v.mutable_list_value();
  for (const auto& l : links) *list->add_values() = Link(l);
  return v;
}

} // namespace

ReportFormat ParseReportFormat(const std::string& name) {
  if (name == "text") return ReportFormat::kText;
  if (name == "json") return ReportFormat::kJson;
  if (name == "markdown" || name == "md") return ReportFormat::kMarkdown;
  throw util::ValidationError("unknown report format: " + name);
}

// ------------------------------------------------------------
// Analysis
// ------------------------------------------------------------

ReportMetrics ComputeMetrics(const std::vector<EventRecord>& events, const std::vector<uint32_t>& depths) {
  ReportMetrics m;
  m.total_events = events.size();

  std::map<std::string, size_t> slot;
  for (const auto& e : events) {
    if (e.IsRoot())
      m.root_events++;
    else
      m.child_events++;

    auto [it, inserted] = slot.emplace(e.command, m.command_distribution.size());
    if (inserted) m.command_distribution.emplace_back(e.command, 0);
    m.command_distribution[it->second].second++;
  }
  m.unique_commands = m.command_distribution.size();

  if (events.size() > 1) {
    auto [min_id, max_id] = std::minmax_element(events.begin(), events.end(),
                                                [](const auto& a, const auto& b) { return a.id < b.id; });
    m.id_span = max_id->id - min_id->id;

    auto [min_ts, max_ts] = std::minmax_element(
        events.begin(), events.end(), [](const auto& a, const auto& b) { return a.timestamp_ms < b.timestamp_ms; });
    m.time_span_ms = max_ts->timestamp_ms - min_ts->timestamp_ms;
  }

  if (!depths.empty()) {
    uint64_t total = 0;
    for (auto d : depths) total += d;
    m.average_depth = static_cast<double>(total) / static_cast<double>(depths.size());
  }
  return m;
}

ReportRelationships AnalyzeRelationships(const std::vector<EventRecord>& events) {
  ReportRelationships rel;
  const auto          children = ChildrenOf(events);

  for (const auto& e : events) {
    auto        it   = children.find(e.id);
    const auto& kids = it == children.end() ? std::vector<const EventRecord*>{} : it->second;

    if (kids.size() > 1) {
      BranchPoint bp{{e.id, e.command}, {}};
      for (const auto* c : kids) bp.children.push_back({c->id, c->command});
      rel.branch_points.push_back(std::move(bp));
    }
    if (kids.empty() && e.causation_id) {
      rel.leaf_events.push_back({e.id, e.command});
    }
  }

  // first child wins ties, children are in ascending id
  std::function<std::vector<ChainLink>(const EventRecord&, std::unordered_set<int64_t>&)> longest =
      [&](const EventRecord& e, std::unordered_set<int64_t>& path) -> std::vector<ChainLink> {
    if (!path.insert(e.id).second) return {};

    std::vector<ChainLink> best;
    if (auto it = children.find(e.id); it != children.end()) {
      for (const auto* c : it->second) {
        auto chain = longest(*c, path);
        if (chain.size() > best.size()) best = std::move(chain);
      }
    }
    path.erase(e.id);

    best.insert(best.begin(), ChainLink{e.id, e.command});
    return best;
  };

  for (const auto& e : events) {
    if (!e.IsRoot()) continue;
    std::unordered_set<int64_t> path;
    auto                        chain = longest(e, path);
    if (chain.size() > 1) rel.chains.push_back(Chain{e.id, std::move(chain)});
  }
  return rel;
}

// ------------------------------------------------------------
// Text
// ------------------------------------------------------------

std::string RenderText(const EventReport& r) {
  if (r.error) return "Error: " + *r.error;

  std::ostringstream out;
  out << r.title << "\n" << std::string(r.title.size(), '=') << "\n\n";
  out << "Generated: " << r.generated_at << "\n\n";

  if (r.metrics) {
    const auto& m = *r.metrics;
    out << "METRICS\n-------\n";
    out << "Total Events: " << m.total_events << "\n";
    out << "Root Events: " << m.root_events << "\n";
    out << "Child Events: " << m.child_events << "\n";
    out << "Unique Event Types: " << m.unique_commands << "\n";
    out << "Average Depth: " << FormatDepth(m.average_depth) << "\n";
    out << "Time Span: " << m.id_span << " event IDs (" << m.time_span_ms << " ms)\n\n";

    out << "Event Type Distribution:\n";
    for (const auto& [command, count] : m.command_distribution) out << "  " << command << ": " << count << "\n";
    out << "\n";
  }

  if (r.relationships) {
    const auto& rel = *r.relationships;
    out << "RELATIONSHIPS\n-------------\n";

    if (!rel.branch_points.empty()) {
      out << "Branch Points: " << rel.branch_points.size() << "\n";
      for (const auto& bp : rel.branch_points)
        out << "  Event " << bp.event.id << " (" << bp.event.command << ") -> " << bp.children.size() << " children\n";
      out << "\n";
    }

    if (!rel.chains.empty()) {
      out << "Longest Chains:\n";
      for (const auto& chain : rel.chains) {
        out << "  " << chain.events.size() << " events: ";
        for (size_t i = 0; i < chain.events.size(); ++i) {
          if (i) out << " -> ";
          out << chain.events[i].id << "(" << chain.events[i].command << ")";
        }
        out << "\n";
      }
      out << "\n";
    }

    if (!rel.leaf_events.empty()) {
      out << "Leaf Events: " << rel.leaf_events.size() << "\n";
      for (const auto& leaf : rel.leaf_events) out << "  " << leaf.id << " (" << leaf.command << ")\n";
      out << "\n";
    }
  }

  out << "EVENTS\n------\n";
  for (const auto& e : r.events) {
    out << e.id << ": " << e.command;
    if (e.IsRoot()) out << " [ROOT]";
    if (e.causation_id) out << " <- " << *e.causation_id;
    out << "\n";
  }
  return out.str();
}

// ------------------------------------------------------------
// JSON
// ------------------------------------------------------------

std::string RenderJson(const EventReport& r) {
  google::protobuf::Struct root;
  auto&                    f = *root.mutable_fields();

  f["title"]       = Str(r.title);
  f["generatedAt"] = Str(r.generated_at);
  if (r.error) f["error"] = Str(*r.error);

  auto* events = f["events"].mutable_list_value();
  for (const auto& e : r.events) {
    google::protobuf::Value v;
    auto&                   ef = *v.mutable_struct_value()->mutable_fields();
    ef["id"]                   = Num(static_cast<double>(e.id));
    ef["command"]              = Str(e.command);
    ef["causationId"]          = e.causation_id ? Num(static_cast<double>(*e.causation_id)) : Null();
    ef["correlationId"]        = e.correlation_id ? Str(*e.correlation_id) : Null();
    ef["timestamp"]            = Num(static_cast<double>(e.timestamp_ms));
    ef["payload"]              = e.payload;
    ef["isRoot"]               = Bool(e.IsRoot());
    *events->add_values()      = std::move(v);
  }

  auto& metrics = *f["metrics"].mutable_struct_value()->mutable_fields();
  if (r.metrics) {
    const auto& m            = *r.metrics;
    metrics["totalEvents"]   = Num(static_cast<double>(m.total_events));
    metrics["rootEvents"]    = Num(static_cast<double>(m.root_events));
    metrics["childEvents"]   = Num(static_cast<double>(m.child_events));
    metrics["uniqueEventTypes"] = Num(static_cast<double>(m.unique_commands));
    metrics["timeSpan"]      = Num(static_cast<double>(m.id_span));
    metrics["timeSpanMs"]    = Num(static_cast<double>(m.time_span_ms));
    metrics["averageDepth"]  = Str(FormatDepth(m.average_depth));

    auto& dist = *metrics["eventTypeDistribution"].mutable_struct_value()->mutable_fields();
    for (const auto& [command, count] : m.command_distribution) dist[command] = Num(static_cast<double>(count));
  }

  auto& relationships = *f["relationships"].mutable_struct_value()->mutable_fields();
  if (r.relationships) {
    const auto& rel = *r.relationships;

    auto* bps = relationships["branchPoints"].mutable_list_value();
    for (const auto& bp : rel.branch_points) {
      google::protobuf::Value v;
      auto&                   bf = *v.mutable_struct_value()->mutable_fields();
      bf["eventId"]              = Num(static_cast<double>(bp.event.id));
      bf["eventCmd"]             = Str(bp.event.command);
      bf["childCount"]           = Num(static_cast<double>(bp.children.size()));
      bf["children"]             = Links(bp.children);
      *bps->add_values()         = std::move(v);
    }

    relationships["leafEvents"] = Links(rel.leaf_events);

    auto* chains = relationships["chains"].mutable_list_value();
    for (const auto& chain : rel.chains) {
      google::protobuf::Value v;
      auto&                   cf = *v.mutable_struct_value()->mutable_fields();
      cf["startEvent"]           = Num(static_cast<double>(chain.root_id));
      cf["length"]               = Num(static_cast<double>(chain.events.size()));
      cf["events"]               = Links(chain.events);
      *chains->add_values()      = std::move(v);
    }
  }

  return util::ToJson(root, true);
}

// ------------------------------------------------------------
// Markdown
// ------------------------------------------------------------

std::string RenderMarkdown(const EventReport& r) {
  if (r.error) return "# Error\n\n" + *r.error;

  std::ostringstream out;
  out << "# " << r.title << "\n\n";
  out << "*Generated: " << r.generated_at << "*\n\n";

  if (r.metrics) {
    const auto& m = *r.metrics;
    out << "## Metrics\n\n";
    out << "- **Total Events:** " << m.total_events << "\n";
    out << "- **Root Events:** " << m.root_events << "\n";
    out << "- **Child Events:** " << m.child_events << "\n";
    out << "- **Unique Event Types:** " << m.unique_commands << "\n";
    out << "- **Average Depth:** " << FormatDepth(m.average_depth) << "\n";
    out << "- **Time Span:** " << m.id_span << " event IDs\n\n";

    out << "### Event Type Distribution\n\n";
    for (const auto& [command, count] : m.command_distribution) out << "- **" << command << ":** " << count << "\n";
    out << "\n";
  }

  if (r.relationships) {
    const auto& rel = *r.relationships;
    out << "## Relationships\n\n";

    if (!rel.branch_points.empty()) {
      out << "### Branch Points\n\n";
      for (const auto& bp : rel.branch_points)
        out << "- Event **" << bp.event.id << "** (" << bp.event.command << ") branches to " << bp.children.size()
            << " children\n";
      out << "\n";
    }

    if (!rel.chains.empty()) {
      out << "### Longest Chains\n\n";
      for (const auto& chain : rel.chains) {
        out << "- " << chain.events.size() << " events: ";
        for (size_t i = 0; i < chain.events.size(); ++i) {
          if (i) out << " → ";
          out << "**" << chain.events[i].id << "**(" << chain.events[i].command << ")";
        }
        out << "\n";
      }
      out << "\n";
    }
  }

  out << "## Events\n\n";
  out << "| ID | Command | Root | Causation |\n";
  out << "|----|---------|------|-----------|\n";
  for (const auto& e : r.events) {
    out << "| " << e.id << " | " << e.command << " | " << (e.IsRoot() ? "✓" : "") << " | ";
    if (e.causation_id) out << *e.causation_id;
    out << " |\n";
  }
  return out.str();
}

std::string Render(const EventReport& report, ReportFormat format) {
  switch (format) {
    case ReportFormat::kJson:
      return RenderJson(report);
    case ReportFormat::kMarkdown:
      return RenderMarkdown(report);
    case ReportFormat::kText:
    default:
      return RenderText(report);
  }
}

// ------------------------------------------------------------
// Tree
// ------------------------------------------------------------

std::string RenderTree(const std::string& correlation_id, const std::vector<EventRecord>& events) {
  if (events.empty()) return "No events found for correlation ID: " + correlation_id;

  const auto children = ChildrenOf(events);

  std::ostringstream          out;
  std::unordered_set<int64_t> visited;

  std::function<void(const EventRecord&, const std::string&, bool)> node = [&](const EventRecord& e,
                                                                              const std::string& prefix, bool last) {
    if (!visited.insert(e.id).second) return;
    out << prefix << (last ? "└── " : "├── ") << "[" << e.id << "] " << e.command << "\n";

    auto it = children.find(e.id);
    if (it == children.end()) return;
    const auto next = prefix + (last ? "    " : "│   ");
    for (size_t i = 0; i < it->second.size(); ++i) node(*it->second[i], next, i + 1 == it->second.size());
  };

  std::vector<const EventRecord*> roots;
  for (const auto& e : events)
    if (e.IsRoot()) roots.push_back(&e);

  out << "Event Tree for Correlation ID: " << correlation_id << "\n";
  out << Repeat("═", 50) << "\n\n";
  for (size_t i = 0; i < roots.size(); ++i) node(*roots[i], "", i + 1 == roots.size());
  return out.str();
}

} // namespace causal::lineage
