#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace causal::db::memory {

namespace {

bool Matches(const model::EventRecord& e, const EventFilter& f) {
  if (f.correlation_id && e.correlation_id != f.correlation_id) return false;
  if (f.causation_id && e.causation_id != f.causation_id) return false;
  if (f.actor && e.actor != *f.actor) return false;
  if (f.command && e.command != *f.command) return false;
  if (f.roots_only && e.causation_id.has_value()) return false;
  if (f.min_id && e.id < *f.min_id) return false;
  if (f.max_id && e.id > *f.max_id) return false;
  if (f.min_timestamp_ms && e.timestamp_ms < *f.min_timestamp_ms) return false;
  if (f.max_timestamp_ms && e.timestamp_ms > *f.max_timestamp_ms) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_id++;
  if (r.payload.kind_case() == google::protobuf::Value::KIND_NOT_SET) {
    r.payload.mutable_struct_value();
  }
  if (r.metadata.kind_case() == google::protobuf::Value::KIND_NOT_SET) {
    r.metadata.mutable_struct_value();
  }
  s.events.emplace(r.id, r);
  return Result::Ok();
}

std::optional<model::EventRecord> MemoryRepository::GetEvent(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.events.find(id);
  if (it == s.events.end()) return std::nullopt;
  return it->second;
}

std::optional<model::EventRecord> MemoryRepository::GetLastEvent(Transaction& t) {
  const auto& s = TX(t).View();
  if (s.events.empty()) return std::nullopt;
  return s.events.rbegin()->second;
}

std::vector<model::EventRecord> MemoryRepository::ListEvents(Transaction& t, const EventFilter& filter, EventOrder order,
                                                             const Pagination& pagination) {
  std::vector<model::EventRecord> matched;
  for (const auto& [_, e] : TX(t).View().events)
    if (Matches(e, filter)) matched.push_back(e);

  if (order == EventOrder::kNewestFirst) {
    std::sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) {
      if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms > b.timestamp_ms;
      return a.id > b.id;
    });
  }

  if (pagination.offset >= matched.size()) return {};

  auto begin = matched.begin() + static_cast<std::ptrdiff_t>(pagination.offset);
  auto end   = matched.end();
  if (pagination.limit && *pagination.limit < static_cast<uint64_t>(end - begin)) {
    end = begin + static_cast<std::ptrdiff_t>(*pagination.limit);
  }
  return {begin, end};
}

uint64_t MemoryRepository::CountEvents(Transaction& t, const EventFilter& filter) {
  const auto& events = TX(t).View().events;
  return static_cast<uint64_t>(
      std::count_if(events.begin(), events.end(), [&](const auto& entry) { return Matches(entry.second, filter); }));
}

std::vector<model::EventRecord> MemoryRepository::ListOrphans(Transaction& t) {
  const auto&                     events = TX(t).View().events;
  std::vector<model::EventRecord> out;
  for (const auto& [_, e] : events)
    if (e.causation_id && !events.contains(*e.causation_id)) out.push_back(e);
  return out;
}

Result MemoryRepository::Reset() {
  std::scoped_lock lock(mutex_);
  committed_ = State{};
  committed_version_++;
  return Result::Ok();
}

} // namespace causal::db::memory
