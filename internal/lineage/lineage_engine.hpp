#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/lineage/event_report.hpp"

namespace causal::lineage {

struct RankedEvent {
  db::model::EventRecord event;
  // hops below the queried event (children = 1)
  uint32_t depth = 0;
};

enum class Relation {
  kAncestor,
  kDescendant,
  kCousin,
};

const char* RelationName(Relation relation);

struct FamilyMember {
  db::model::EventRecord event;
  Relation               relation;
};

// One root-to-node causation path inside a correlation.
struct Branch {
  db::model::EventRecord event;
  int64_t                root_id = 0;
  // "1->2->3"
  std::string path;
  uint32_t    depth = 0;
};

struct CriticalPath {
  std::vector<db::model::EventRecord> events;
  std::string                         path;

  size_t Length() const {
    return events.size();
  }
};

/*
  LineageQueryEngine

  Read-only graph queries over the causation forest.

  Each call runs in its own read transaction. Traversals are explicit
  BFS/DFS; adjacency comes from causation_id lookups or, for queries
  scoped to one correlation, from that correlation's rows. Every
  traversal tracks visited ids so corrupt (cyclic) data terminates.

  Nothing here throws on empty results.
*/

class LineageQueryEngine {
 public:
  explicit LineageQueryEngine(std::shared_ptr<db::EventRepository> repository);

  // ---------------------------------------------------------------------
  // Roots
  // ---------------------------------------------------------------------

  std::vector<db::model::EventRecord> GetRootEvents() const;
  std::vector<db::model::EventRecord> GetRootEventsInRange(int64_t first_id, int64_t last_id) const;
  std::vector<db::model::EventRecord> GetRootEventsByCommand(const std::string& command) const;
  std::vector<db::model::EventRecord> GetRootEventsByPayloadField(const std::string& field,
                                                                  const std::string& value) const;

  // ---------------------------------------------------------------------
  // Children / descendants
  // ---------------------------------------------------------------------

  std::vector<db::model::EventRecord> GetDirectChildren(int64_t id) const;
  std::vector<db::model::EventRecord> GetChildEvents(int64_t id) const {
    return GetDirectChildren(id);
  }
  std::vector<db::model::EventRecord> GetChildrenByCommand(int64_t id, const std::string& command) const;

  // (depth asc, id asc), self excluded
  std::vector<RankedEvent> GetDescendantEvents(int64_t id) const;

  // ---------------------------------------------------------------------
  // Relatives
  // ---------------------------------------------------------------------

  std::vector<db::model::EventRecord> GetSiblingEvents(int64_t id) const;
  std::vector<db::model::EventRecord> GetRelatedEvents(int64_t id) const;
  std::vector<db::model::EventRecord> GetCousinEvents(int64_t id) const;
  std::vector<FamilyMember>           GetEventFamily(int64_t id) const;

  // ---------------------------------------------------------------------
  // Structure
  // ---------------------------------------------------------------------

  // Hops to a root. A dangling causation counts as one hop. Unknown id -> 0.
  uint32_t GetEventDepth(int64_t id) const;

  std::vector<Branch>         GetEventBranches(const std::string& correlation_id) const;
  std::optional<CriticalPath> GetCriticalPath(const std::string& correlation_id) const;

  std::vector<db::model::EventRecord> FindOrphanedEvents() const;

  uint64_t GetEventInfluence(int64_t id) const;

  std::vector<db::model::EventRecord> GetEventsByCorrelationId(const std::string& correlation_id) const;

  // ---------------------------------------------------------------------
  // Reporting
  // ---------------------------------------------------------------------

  EventReport GenerateReport(const ReportOptions& options) const;

  std::string GenerateEventTree(const std::string& correlation_id) const;

 private:
  using Children = std::map<int64_t, std::vector<const db::model::EventRecord*>>;

  std::vector<db::model::EventRecord> List(const db::EventFilter& filter) const;

  std::vector<RankedEvent> Descendants(db::Transaction& tx, int64_t id) const;
  std::vector<int64_t>     AncestorIds(db::Transaction& tx, const db::model::EventRecord& event) const;
  uint32_t                 Depth(db::Transaction& tx, int64_t id) const;

  // causation_id -> children (ascending id), restricted to `events`
  static Children Adjacency(const std::vector<db::model::EventRecord>& events);

  std::shared_ptr<db::EventRepository> repository_;
};

} // namespace causal::lineage
