#include "event_patterns.hpp"

#include <cctype>
#include <functional>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace causal::patterns {

using causal::observability::IntField;
using causal::observability::StringField;
using google::protobuf::Value;

namespace {

const std::set<std::string> kExternalPrefixes = {"user",      "time",   "webhook", "api",      "manual",
                                                 "scheduled", "motion", "vote",    "decision", "external"};

const std::vector<std::string> kExternalFragments = {"Clicked", "Submitted", "Started", "Ended",   "Passed",
                                                     "Failed",  "Received",  "Expired", "Reached", "Occurred"};

// Later keys win. Non-struct sources are ignored.
void MergeFields(Value& into, const Value& from) {
  if (!from.has_struct_value()) return;
  auto* fields = into.mutable_struct_value()->mutable_fields();
  for (const auto& [key, value] : from.struct_value().fields()) (*fields)[key] = value;
}

Value StringValue(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

Value NumberValue(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

// request.metadata, then tags, then caller metadata
Value Enrich(const Value& request_metadata, const Value& tags, const Value& metadata) {
  Value out = util::EmptyStruct();
  MergeFields(out, request_metadata);
  MergeFields(out, tags);
  MergeFields(out, metadata);
  return out;
}

} // namespace

// ------------------------------------------------------------
// CorrelationContext
// ------------------------------------------------------------

Value CorrelationContext::ToMetadata() const {
  Value correlations = util::EmptyStruct();
  for (const auto& [name, id] : secondary_) {
    (*correlations.mutable_struct_value()->mutable_fields())[name] = StringValue(id);
  }
  Value out = util::EmptyStruct();
  (*out.mutable_struct_value()->mutable_fields())["correlations"] = std::move(correlations);
  return out;
}

// ------------------------------------------------------------
// PatternedEventStore
// ------------------------------------------------------------

PatternedEventStore::PatternedEventStore(store::EventStore& store, const projection::Projection& projection,
                                         PatternOptions options)
    : store_(store), projection_(projection), options_(options) {}

bool PatternedEventStore::LooksLikeExternalEvent(const std::string& command) {
  if (command.empty()) return false;

  // leading word of a CamelCase name
  size_t end = 1;
  while (end < command.size() && !std::isupper(static_cast<unsigned char>(command[end]))) end++;
  std::string prefix = command.substr(0, end);
  for (auto& c : prefix) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (kExternalPrefixes.count(prefix)) return true;

  for (const auto& fragment : kExternalFragments) {
    if (command.find(fragment) != std::string::npos) return true;
  }
  return false;
}

StoredEvent PatternedEventStore::Persist(const store::StoreRequest& request, const projection::Hooks& hooks) {
  auto result = store_.Store(request, projection_, hooks);
  if (!result.Row()) {
    throw util::ValidationError(request.command + ": " + result.Error().message);
  }

  auto row         = *result.Row();
  auto id          = row.id;
  auto correlation = row.correlation_id.value_or("");
  return StoredEvent{id, std::move(correlation), std::move(row), std::move(result)};
}

StoredEvent PatternedEventStore::StoreExternal(store::StoreRequest request, const Value& metadata,
                                               const projection::Hooks& hooks) {
  if (options_.enforce_patterns) {
    if (request.causation_id) {
      throw util::ValidationError("external event '" + request.command + "' cannot have a causation id");
    }
    if (!LooksLikeExternalEvent(request.command)) {
      CAUSAL_LOG_WARN("external event does not follow external naming", {StringField("command", request.command)});
    }
  }

  if (!request.correlation_id) request.correlation_id = util::NewCorrelationId();

  Value tags = util::EmptyStruct();
  (*tags.mutable_struct_value()->mutable_fields())["eventType"] = StringValue("external");
  request.metadata = Enrich(request.metadata, tags, metadata);

  return Persist(request, hooks);
}

StoredEvent PatternedEventStore::StoreInternal(store::StoreRequest request, std::optional<int64_t> parent_id,
                                               const Value& metadata, const projection::Hooks& hooks) {
  const auto parent = parent_id ? parent_id : request.causation_id;

  if (options_.enforce_patterns) {
    if (!parent) {
      throw util::ValidationError("internal event '" + request.command + "' must have a parent event or causation id");
    }
    if (LooksLikeExternalEvent(request.command)) {
      CAUSAL_LOG_WARN("internal event looks like an external one", {StringField("command", request.command)});
    }
  }

  std::optional<std::string> parent_correlation;
  if (parent && options_.validate_relationships) {
    auto record = store_.RetrieveById(*parent);
    if (!record) throw util::NotFound("parent event " + std::to_string(*parent) + " not found");
    parent_correlation = record->correlation_id;
  }

  request.causation_id = parent;
  if (!request.correlation_id) request.correlation_id = parent_correlation;

  Value tags   = util::EmptyStruct();
  auto* fields = tags.mutable_struct_value()->mutable_fields();
  (*fields)["eventType"] = StringValue("internal");
  if (parent) (*fields)["parentId"] = NumberValue(static_cast<double>(*parent));
  request.metadata = Enrich(request.metadata, tags, metadata);

  return Persist(request, hooks);
}

StoredEvent PatternedEventStore::StoreInternalWithContexts(store::StoreRequest request, std::optional<int64_t> parent_id,
                                                           const CorrelationContext& contexts,
                                                           const projection::Hooks& hooks) {
  if (contexts.Primary()) request.correlation_id = contexts.Primary();

  // request metadata wins over the context block
  Value metadata = contexts.ToMetadata();
  MergeFields(metadata, request.metadata);
  return StoreInternal(std::move(request), parent_id, metadata, hooks);
}

BatchResult PatternedEventStore::BatchInternal(int64_t parent_id, const std::vector<store::StoreRequest>& requests,
                                               const projection::Hooks& hooks) {
  BatchResult batch;
  batch.batch_id = util::NewCorrelationId();
  batch.events.reserve(requests.size());

  for (size_t i = 0; i < requests.size(); ++i) {
    Value metadata = util::EmptyStruct();
    auto* fields   = metadata.mutable_struct_value()->mutable_fields();
    (*fields)["batchId"]       = StringValue(batch.batch_id);
    (*fields)["batchPosition"] = NumberValue(static_cast<double>(i + 1));
    (*fields)["batchTotal"]    = NumberValue(static_cast<double>(requests.size()));
    MergeFields(metadata, requests[i].metadata);

    batch.events.push_back(StoreInternal(requests[i], parent_id, metadata, hooks));
  }

  CAUSAL_LOG_DEBUG("internal batch stored", {StringField("batch_id", batch.batch_id), IntField("parent_id", parent_id),
                                             IntField("events", static_cast<int64_t>(batch.events.size()))});
  return batch;
}

// ------------------------------------------------------------
// EventChainBuilder
// ------------------------------------------------------------

EventChainBuilder& EventChainBuilder::StartWith(store::StoreRequest external, Value metadata) {
  steps_.push_back(Step{true, std::move(external), std::move(metadata), std::nullopt});
  return *this;
}

EventChainBuilder& EventChainBuilder::Then(store::StoreRequest internal, Value metadata) {
  if (steps_.empty()) throw util::ValidationError("event chain must start with an external event");
  steps_.push_back(Step{false, std::move(internal), std::move(metadata), steps_.size() - 1});
  return *this;
}

EventChainBuilder& EventChainBuilder::ThenEach(const std::vector<store::StoreRequest>& internals, Value metadata) {
  if (steps_.empty()) throw util::ValidationError("event chain must start with an external event");
  const size_t parent = steps_.size() - 1;
  for (const auto& request : internals) steps_.push_back(Step{false, request, metadata, parent});
  return *this;
}

EventChainBuilder::Result EventChainBuilder::Execute(const projection::Hooks& hooks) {
  if (steps_.empty()) throw util::ValidationError("event chain is empty");

  Result result;
  result.events.reserve(steps_.size());
  for (const auto& step : steps_) {
    if (step.external) {
      result.events.push_back(store_.StoreExternal(step.request, step.metadata, hooks));
    } else {
      result.events.push_back(store_.StoreInternal(step.request, result.events[*step.parent_index].id, step.metadata, hooks));
    }
  }

  std::vector<bool> has_child(steps_.size(), false);
  for (const auto& step : steps_) {
    if (step.parent_index) has_child[*step.parent_index] = true;
  }
  for (size_t i = 0; i < steps_.size(); ++i) {
    if (!has_child[i]) result.leaf_indices.push_back(i);
  }
  return result;
}

// ------------------------------------------------------------
// EventPatternQueries
// ------------------------------------------------------------

std::vector<db::model::EventRecord> EventPatternQueries::FindExternalEvents(const ExternalEventQuery& query) const {
  db::EventFilter filter;
  filter.roots_only       = true;
  filter.command          = query.command;
  filter.min_timestamp_ms = query.since_ms;
  filter.max_timestamp_ms = query.until_ms;
  return store_.List(filter);
}

std::vector<db::model::EventRecord> EventPatternQueries::FindCausedBy(int64_t id, bool recursive,
                                                                      uint32_t max_depth) const {
  std::vector<db::model::EventRecord> out;
  if (max_depth == 0) return out;

  std::set<int64_t> visited;
  // level is the depth of id's children below the starting event
  std::function<void(int64_t, uint32_t)> collect = [&](int64_t parent, uint32_t level) {
    if (!visited.insert(parent).second) return;

    auto children = store_.GetChildEvents(parent);
    out.insert(out.end(), children.begin(), children.end());
    if (!recursive || level >= max_depth) return;
    for (const auto& child : children) collect(child.id, level + 1);
  };
  collect(id, 1);
  return out;
}

std::vector<db::model::EventRecord> EventPatternQueries::FindBySecondaryCorrelation(
    const std::string& type, const std::string& correlation_id) const {
  std::vector<db::model::EventRecord> out;

  auto stream = store_.StreamEvents();
  while (auto batch = stream.Next()) {
    for (auto& row : *batch) {
      if (!row.metadata.has_struct_value()) continue;
      const auto& fields = row.metadata.struct_value().fields();
      auto        it     = fields.find("correlations");
      if (it == fields.end() || !it->second.has_struct_value()) continue;

      const auto& correlations = it->second.struct_value().fields();
      auto        match        = correlations.find(type);
      if (match != correlations.end() && match->second.string_value() == correlation_id) out.push_back(std::move(row));
    }
  }
  return out;
}

} // namespace causal::patterns
