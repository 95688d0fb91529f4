#include "lineage_engine.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace causal::lineage {

using db::model::EventRecord;

const char* RelationName(Relation relation) {
  switch (relation) {
    case Relation::kAncestor:
      return "ancestor";
    case Relation::kDescendant:
      return "descendant";
    case Relation::kCousin:
      return "cousin";
  }
  return "unknown";
}

LineageQueryEngine::LineageQueryEngine(std::shared_ptr<db::EventRepository> repository)
    : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("lineage engine requires a repository");
  }
}

std::vector<EventRecord> LineageQueryEngine::List(const db::EventFilter& filter) const {
  auto tx   = repository_->BeginRead();
  auto rows = repository_->ListEvents(*tx, filter, db::EventOrder::kIdAscending, {});
  tx->Commit();
  return rows;
}

LineageQueryEngine::Children LineageQueryEngine::Adjacency(const std::vector<EventRecord>& events) {
  Children children;
  for (const auto& e : events)
    if (e.causation_id) children[*e.causation_id].push_back(&e);
  // events arrive in ascending id, so each child list is already ordered
  return children;
}

// ------------------------------------------------------------
// Roots
// ------------------------------------------------------------

std::vector<EventRecord> LineageQueryEngine::GetRootEvents() const {
  db::EventFilter filter;
  filter.roots_only = true;
  return List(filter);
}

std::vector<EventRecord> LineageQueryEngine::GetRootEventsInRange(int64_t first_id, int64_t last_id) const {
  db::EventFilter filter;
  filter.roots_only = true;
  filter.min_id     = first_id;
  filter.max_id     = last_id;
  return List(filter);
}

std::vector<EventRecord> LineageQueryEngine::GetRootEventsByCommand(const std::string& command) const {
  db::EventFilter filter;
  filter.roots_only = true;
  filter.command    = command;
  return List(filter);
}

std::vector<EventRecord> LineageQueryEngine::GetRootEventsByPayloadField(const std::string& field,
                                                                        const std::string& value) const {
  std::vector<EventRecord> out;
  for (auto& root : GetRootEvents()) {
    if (!root.payload.has_struct_value()) continue;
    const auto& fields = root.payload.struct_value().fields();
    auto        it     = fields.find(field);
    if (it != fields.end() && util::ScalarText(it->second) == value) out.push_back(std::move(root));
  }
  return out;
}

// ------------------------------------------------------------
// Children / descendants
// ------------------------------------------------------------

std::vector<EventRecord> LineageQueryEngine::GetDirectChildren(int64_t id) const {
  db::EventFilter filter;
  filter.causation_id = id;
  return List(filter);
}

std::vector<EventRecord> LineageQueryEngine::GetChildrenByCommand(int64_t id, const std::string& command) const {
  db::EventFilter filter;
  filter.causation_id = id;
  filter.command      = command;
  return List(filter);
}

std::vector<RankedEvent> LineageQueryEngine::Descendants(db::Transaction& tx, int64_t id) const {
  std::vector<RankedEvent> result;

  std::queue<std::pair<int64_t, uint32_t>> q;
  std::unordered_set<int64_t>              visited;

  q.emplace(id, 0);
  visited.insert(id);

  while (!q.empty()) {
    auto [node, depth] = q.front();
    q.pop();

    db::EventFilter filter;
    filter.causation_id = node;
    for (auto& child : repository_->ListEvents(tx, filter, db::EventOrder::kIdAscending, {})) {
      if (!visited.insert(child.id).second) continue;
      q.emplace(child.id, depth + 1);
      result.push_back(RankedEvent{std::move(child), depth + 1});
    }
  }

  // BFS yields depth order; ids within a level come from different parents
  std::stable_sort(result.begin(), result.end(), [](const RankedEvent& a, const RankedEvent& b) {
    if (a.depth != b.depth) return a.depth < b.depth;
    return a.event.id < b.event.id;
  });
  return result;
}

std::vector<RankedEvent> LineageQueryEngine::GetDescendantEvents(int64_t id) const {
  auto tx  = repository_->BeginRead();
  auto out = Descendants(*tx, id);
  tx->Commit();
  return out;
}

uint64_t LineageQueryEngine::GetEventInfluence(int64_t id) const {
  return GetDescendantEvents(id).size();
}

// ------------------------------------------------------------
// Relatives
// ------------------------------------------------------------

std::vector<int64_t> LineageQueryEngine::AncestorIds(db::Transaction& tx, const EventRecord& event) const {
  std::vector<int64_t>        ids;
  std::unordered_set<int64_t> visited{event.id};

  auto parent_id = event.causation_id;
  while (parent_id && visited.insert(*parent_id).second) {
    auto parent = repository_->GetEvent(tx, *parent_id);
    if (!parent) break;
    ids.push_back(parent->id);
    parent_id = parent->causation_id;
  }
  return ids;
}

std::vector<EventRecord> LineageQueryEngine::GetSiblingEvents(int64_t id) const {
  auto tx    = repository_->BeginRead();
  auto event = repository_->GetEvent(*tx, id);

  std::vector<EventRecord> out;
  if (event && event->causation_id) {
    db::EventFilter filter;
    filter.causation_id = event->causation_id;
    for (auto& e : repository_->ListEvents(*tx, filter, db::EventOrder::kIdAscending, {}))
      if (e.id != id) out.push_back(std::move(e));
  }
  tx->Commit();
  return out;
}

std::vector<EventRecord> LineageQueryEngine::GetRelatedEvents(int64_t id) const {
  auto tx    = repository_->BeginRead();
  auto event = repository_->GetEvent(*tx, id);

  std::vector<EventRecord> out;
  if (event && event->correlation_id) {
    db::EventFilter filter;
    filter.correlation_id = event->correlation_id;
    for (auto& e : repository_->ListEvents(*tx, filter, db::EventOrder::kIdAscending, {}))
      if (e.id != id) out.push_back(std::move(e));
  }
  tx->Commit();
  return out;
}

std::vector<EventRecord> LineageQueryEngine::GetCousinEvents(int64_t id) const {
  auto tx    = repository_->BeginRead();
  auto event = repository_->GetEvent(*tx, id);
  if (!event || !event->correlation_id) {
    tx->Commit();
    return {};
  }

  std::unordered_set<int64_t> excluded{id};
  for (auto a : AncestorIds(*tx, *event)) excluded.insert(a);
  for (const auto& d : Descendants(*tx, id)) excluded.insert(d.event.id);

  db::EventFilter filter;
  filter.correlation_id = event->correlation_id;

  std::vector<EventRecord> out;
  for (auto& e : repository_->ListEvents(*tx, filter, db::EventOrder::kIdAscending, {})) {
    if (excluded.contains(e.id)) continue;
    // sibling
    if (event->causation_id && e.causation_id == event->causation_id) continue;
    out.push_back(std::move(e));
  }
  tx->Commit();
  return out;
}

std::vector<FamilyMember> LineageQueryEngine::GetEventFamily(int64_t id) const {
  auto tx    = repository_->BeginRead();
  auto event = repository_->GetEvent(*tx, id);
  if (!event) {
    tx->Commit();
    return {};
  }

  std::vector<FamilyMember> family;
  for (auto a : AncestorIds(*tx, *event)) {
    if (auto row = repository_->GetEvent(*tx, a)) family.push_back(FamilyMember{std::move(*row), Relation::kAncestor});
  }
  for (auto& d : Descendants(*tx, id)) family.push_back(FamilyMember{std::move(d.event), Relation::kDescendant});
  tx->Commit();

  for (auto& c : GetCousinEvents(id)) family.push_back(FamilyMember{std::move(c), Relation::kCousin});

  std::sort(family.begin(), family.end(),
            [](const FamilyMember& a, const FamilyMember& b) { return a.event.id < b.event.id; });
  return family;
}

// ------------------------------------------------------------
// Depth
// ------------------------------------------------------------

uint32_t LineageQueryEngine::Depth(db::Transaction& tx, int64_t id) const {
  auto event = repository_->GetEvent(tx, id);
  if (!event) return 0;

  uint32_t                    depth = 0;
  std::unordered_set<int64_t> visited{id};

  auto parent_id = event->causation_id;
  while (parent_id) {
    depth++;
    if (!visited.insert(*parent_id).second) break;
    auto parent = repository_->GetEvent(tx, *parent_id);
    if (!parent) break;
    parent_id = parent->causation_id;
  }
  return depth;
}

uint32_t LineageQueryEngine::GetEventDepth(int64_t id) const {
  auto tx    = repository_->BeginRead();
  auto depth = Depth(*tx, id);
  tx->Commit();
  return depth;
}

// ------------------------------------------------------------
// Branches / critical path
// ------------------------------------------------------------

std::vector<Branch> LineageQueryEngine::GetEventBranches(const std::string& correlation_id) const {
  const auto events   = GetEventsByCorrelationId(correlation_id);
  const auto children = Adjacency(events);

  std::vector<Branch>         branches;
  std::unordered_set<int64_t> visited;

  // DFS from each root; path carries the ids walked so far
  std::function<void(const EventRecord&, int64_t, const std::string&, uint32_t)> walk =
      [&](const EventRecord& e, int64_t root_id, const std::string& prefix, uint32_t depth) {
        if (!visited.insert(e.id).second) return;
        const auto path = prefix.empty() ? std::to_string(e.id) : prefix + "->" + std::to_string(e.id);
        branches.push_back(Branch{e, root_id, path, depth});

        auto it = children.find(e.id);
        if (it == children.end()) return;
        for (const auto* child : it->second) walk(*child, root_id, path, depth + 1);
      };

  for (const auto& e : events)
    if (e.IsRoot()) walk(e, e.id, "", 0);

  std::sort(branches.begin(), branches.end(), [](const Branch& a, const Branch& b) {
    if (a.root_id != b.root_id) return a.root_id < b.root_id;
    return a.event.id < b.event.id;
  });
  return branches;
}

std::optional<CriticalPath> LineageQueryEngine::GetCriticalPath(const std::string& correlation_id) const {
  const auto events   = GetEventsByCorrelationId(correlation_id);
  const auto children = Adjacency(events);

  // longest downward chain length per node (post-order)
  std::unordered_map<int64_t, size_t> height;
  std::unordered_set<int64_t>         on_stack;

  std::function<size_t(const EventRecord&)> measure = [&](const EventRecord& e) -> size_t {
    if (auto it = height.find(e.id); it != height.end()) return it->second;
    if (!on_stack.insert(e.id).second) return 0;

    size_t best = 0;
    if (auto it = children.find(e.id); it != children.end()) {
      for (const auto* child : it->second) best = std::max(best, measure(*child));
    }
    on_stack.erase(e.id);
    return height[e.id] = best + 1;
  };

  const EventRecord* start = nullptr;
  for (const auto& e : events) {
    if (!e.IsRoot()) continue;
    // strict > keeps the lowest id on ties
    if (!start || measure(e) > measure(*start)) start = &e;
  }
  if (!start) return std::nullopt;

  CriticalPath                result;
  std::unordered_set<int64_t> visited;
  for (const auto* node = start; node && visited.insert(node->id).second;) {
    result.events.push_back(*node);
    result.path += (result.path.empty() ? "" : "->") + std::to_string(node->id);

    const EventRecord* next = nullptr;
    if (auto it = children.find(node->id); it != children.end()) {
      for (const auto* child : it->second)
        if (!next || height[child->id] > height[next->id]) next = child;
    }
    node = next;
  }
  return result;
}

// ------------------------------------------------------------
// Integrity / lookups
// ------------------------------------------------------------

std::vector<EventRecord> LineageQueryEngine::FindOrphanedEvents() const {
  auto tx   = repository_->BeginRead();
  auto rows = repository_->ListOrphans(*tx);
  tx->Commit();
  return rows;
}

std::vector<EventRecord> LineageQueryEngine::GetEventsByCorrelationId(const std::string& correlation_id) const {
  db::EventFilter filter;
  filter.correlation_id = correlation_id;
  return List(filter);
}

// ------------------------------------------------------------
// Reporting
// ------------------------------------------------------------

EventReport LineageQueryEngine::GenerateReport(const ReportOptions& options) const {
  EventReport report;
  report.generated_at = util::FormatIso8601(util::Now());

  if (options.correlation_id) {
    report.events = GetEventsByCorrelationId(*options.correlation_id);
    report.title  = "Event Report for Correlation ID: " + *options.correlation_id;
  } else if (options.event_id) {
    auto tx   = repository_->BeginRead();
    auto main = repository_->GetEvent(*tx, *options.event_id);
    tx->Commit();
    if (main && main->correlation_id) {
      report.events = GetEventsByCorrelationId(*main->correlation_id);
      report.title  = "Event Report for Event ID: " + std::to_string(*options.event_id) +
                     " (Correlation: " + *main->correlation_id + ")";
    }
  }

  if (report.events.empty()) {
    report.error = "No events found";
    return report;
  }

  if (options.include_metrics) {
    std::vector<uint32_t> depths;
    depths.reserve(report.events.size());

    auto tx = repository_->BeginRead();
    for (const auto& e : report.events) depths.push_back(Depth(*tx, e.id));
    tx->Commit();

    report.metrics = ComputeMetrics(report.events, depths);
  }

  if (options.include_relationships) {
    report.relationships = AnalyzeRelationships(report.events);
  }
  return report;
}

std::string LineageQueryEngine::GenerateEventTree(const std::string& correlation_id) const {
  return RenderTree(correlation_id, GetEventsByCorrelationId(correlation_id));
}

} // namespace causal::lineage
