#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/projection/hooks.hpp"
#include "internal/projection/projection.hpp"
#include "internal/store/event_store.hpp"

namespace causal::patterns {

/*
  External/internal event discipline on top of EventStore.

  External events come from outside the system (a click, a webhook, a
  timer) and start a causal tree: they never carry a causation id.
  Internal events are the system's reactions and always name the event
  that caused them. Both are tagged in metadata.eventType.
*/

struct PatternOptions {
  // reject causation on external / missing parent on internal
  bool enforce_patterns = true;
  // internal events must reference a stored parent
  bool validate_relationships = true;
};

// Stored row plus the dispatch outcome. row is always persisted.
struct StoredEvent {
  int64_t                  id = 0;
  std::string              correlation_id;
  db::model::EventRecord   event;
  dispatch::DispatchResult result;
};

struct BatchResult {
  std::string              batch_id;
  std::vector<StoredEvent> events;
};

/*
  Primary correlation plus named secondary ones (rule history, user
  activity, batch). Secondaries travel in metadata.correlations.
*/
class CorrelationContext {
 public:
  explicit CorrelationContext(std::optional<std::string> primary = std::nullopt) : primary_(std::move(primary)) {
  }

  CorrelationContext& Add(const std::string& name, const std::string& correlation_id) {
    secondary_[name] = correlation_id;
    return *this;
  }

  CorrelationContext& AddRule(const std::string& rule_id) {
    return Add("ruleCorrelationId", "RULE-" + rule_id + "-history");
  }

  CorrelationContext& AddUser(const std::string& user_id) {
    return Add("userCorrelationId", "USER-" + user_id + "-activity");
  }

  CorrelationContext& AddBatch(const std::string& batch_id) {
    return Add("batchCorrelationId", batch_id);
  }

  CorrelationContext& AddTransaction(const std::string& transaction_id) {
    return Add("transactionCorrelationId", transaction_id);
  }

  const std::optional<std::string>& Primary() const {
    return primary_;
  }

  const std::map<std::string, std::string>& Secondary() const {
    return secondary_;
  }

  // {"correlations": {name: id, ...}}
  google::protobuf::Value ToMetadata() const;

 private:
  std::optional<std::string>         primary_;
  std::map<std::string, std::string> secondary_;
};

class PatternedEventStore {
 public:
  PatternedEventStore(store::EventStore& store, const projection::Projection& projection, PatternOptions options = {});

  // Throws ValidationError when the request names a causation id.
  StoredEvent StoreExternal(store::StoreRequest request, const google::protobuf::Value& metadata = {},
                            const projection::Hooks& hooks = projection::Hooks::Void());

  // parent_id wins over request.causation_id. Throws ValidationError when
  // neither is set, NotFound when the parent is not stored.
  StoredEvent StoreInternal(store::StoreRequest request, std::optional<int64_t> parent_id,
                            const google::protobuf::Value& metadata = {},
                            const projection::Hooks& hooks = projection::Hooks::Void());

  StoredEvent StoreInternalWithContexts(store::StoreRequest request, std::optional<int64_t> parent_id,
                                        const CorrelationContext& contexts,
                                        const projection::Hooks& hooks = projection::Hooks::Void());

  // Each request is stored as an internal child of parent_id, tagged with
  // batchId / batchPosition (1-based) / batchTotal.
  BatchResult BatchInternal(int64_t parent_id, const std::vector<store::StoreRequest>& requests,
                            const projection::Hooks& hooks = projection::Hooks::Void());

  // Naming heuristic only; used for warnings.
  static bool LooksLikeExternalEvent(const std::string& command);

 private:
  StoredEvent Persist(const store::StoreRequest& request, const projection::Hooks& hooks);

  store::EventStore&            store_;
  const projection::Projection& projection_;
  PatternOptions                options_;
};

/*
  Declarative workflow: one external event, then internal steps each
  caused by the previous step (Then) or fanned out from it (ThenEach).
*/
class EventChainBuilder {
 public:
  explicit EventChainBuilder(PatternedEventStore& store) : store_(store) {
  }

  EventChainBuilder& StartWith(store::StoreRequest external, google::protobuf::Value metadata = {});
  // Throws ValidationError before StartWith.
  EventChainBuilder& Then(store::StoreRequest internal, google::protobuf::Value metadata = {});
  EventChainBuilder& ThenEach(const std::vector<store::StoreRequest>& internals, google::protobuf::Value metadata = {});

  struct Result {
    std::vector<StoredEvent> events;
    // steps no other step names as parent
    std::vector<size_t> leaf_indices;

    const StoredEvent& Root() const {
      return events.front();
    }
  };

  // Throws ValidationError on an empty chain.
  Result Execute(const projection::Hooks& hooks = projection::Hooks::Void());

 private:
  struct Step {
    bool                    external = false;
    store::StoreRequest     request;
    google::protobuf::Value metadata;
    std::optional<size_t>   parent_index;
  };

  PatternedEventStore& store_;
  std::vector<Step>    steps_;
};

struct ExternalEventQuery {
  std::optional<std::string> command;
  std::optional<uint64_t>    since_ms;
  std::optional<uint64_t>    until_ms;
};

class EventPatternQueries {
 public:
  explicit EventPatternQueries(const store::EventStore& store) : store_(store) {
  }

  // Root events (no causation id), ascending id.
  std::vector<db::model::EventRecord> FindExternalEvents(const ExternalEventQuery& query = {}) const;

  // Depth-first descendants of id; max_depth bounds the levels below id.
  std::vector<db::model::EventRecord> FindCausedBy(int64_t id, bool recursive = true, uint32_t max_depth = 10) const;

  // Events whose metadata.correlations[type] equals correlation_id.
  std::vector<db::model::EventRecord> FindBySecondaryCorrelation(const std::string& type,
                                                                 const std::string& correlation_id) const;

 private:
  const store::EventStore& store_;
};

} // namespace causal::patterns
