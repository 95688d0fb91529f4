#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace causal::db {

/*
  Row filter shared by every backend.

  All set fields are ANDed. Id and time bounds are inclusive.
*/
struct EventFilter {
  std::optional<std::string> correlation_id;
  std::optional<int64_t>     causation_id;
  std::optional<std::string> actor;
  std::optional<std::string> command;

  // causation_id IS NULL
  bool roots_only = false;

  std::optional<int64_t> min_id;
  std::optional<int64_t> max_id;

  std::optional<uint64_t> min_timestamp_ms;
  std::optional<uint64_t> max_timestamp_ms;
};

enum class EventOrder {
  kIdAscending,
  // timestamp desc, id desc
  kNewestFirst,
};

struct Pagination {
  std::optional<uint64_t> limit;
  uint64_t                offset = 0;
};

} // namespace causal::db
