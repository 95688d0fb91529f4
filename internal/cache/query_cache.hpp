#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/model/event_record.hpp"

namespace causal::cache {

/*
  Bounded LRU cache for store read queries.

  - Capacity evicts the least recently accessed entry
  - An entry expires ttl after it was written, regardless of access
  - Owned by one EventStore; thread safe
*/

class QueryCache {
 public:
  using Clock  = std::chrono::steady_clock;
  using Value  = std::vector<db::model::EventRecord>;
  using NowFn  = std::function<Clock::time_point()>;

  QueryCache(size_t max_size, std::chrono::milliseconds ttl, NowFn now = {});

  std::optional<Value> Get(const std::string& key);
  void                 Put(const std::string& key, Value value);

  void Clear();

  size_t                    Size() const;
  size_t                    MaxSize() const { return max_size_; }
  std::chrono::milliseconds Ttl() const { return ttl_; }

  static std::string ByIdKey(int64_t id);
  static std::string TransactionKey(const std::string& correlation_id);

 private:
  struct Entry {
    std::string       key;
    Value             value;
    Clock::time_point expires_at;
  };

  Clock::time_point Now() const;

  const size_t                    max_size_;
  const std::chrono::milliseconds ttl_;
  NowFn                           now_;

  mutable std::mutex mutex_;

  // front = most recently used
  std::list<Entry>                                          lru_;
  std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

} // namespace causal::cache
