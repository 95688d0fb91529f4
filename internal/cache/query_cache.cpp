#include "query_cache.hpp"

namespace causal::cache {

QueryCache::QueryCache(size_t max_size, std::chrono::milliseconds ttl, NowFn now)
    : max_size_(max_size), ttl_(ttl), now_(std::move(now)) {
}

QueryCache::Clock::time_point QueryCache::Now() const {
  return now_ ? now_() : Clock::now();
}

std::string QueryCache::ByIdKey(int64_t id) {
  return "byId:" + std::to_string(id);
}

std::string QueryCache::TransactionKey(const std::string& correlation_id) {
  return "transaction:" + correlation_id;
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<QueryCache::Value> QueryCache::Get(const std::string& key) {
  std::scoped_lock lock(mutex_);

  auto it = index_.find(key);
  if (it == index_.end()) return std::nullopt;

  if (Now() >= it->second->expires_at) {
    lru_.erase(it->second);
    index_.erase(it);
    return std::nullopt;
  }

  lru_.splice(lru_.begin(), lru_, it->second);
  return it->second->value;
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void QueryCache::Put(const std::string& key, Value value) {
  if (max_size_ == 0) return;

  std::scoped_lock lock(mutex_);

  const auto expires_at = Now() + ttl_;

  if (auto it = index_.find(key); it != index_.end()) {
    it->second->value      = std::move(value);
    it->second->expires_at = expires_at;
    lru_.splice(lru_.begin(), lru_, it->second);
    return;
  }

  lru_.push_front(Entry{key, std::move(value), expires_at});
  index_[key] = lru_.begin();

  while (lru_.size() > max_size_) {
    index_.erase(lru_.back().key);
    lru_.pop_back();
  }
}

// ------------------------------------------------------------
// Clear
// ------------------------------------------------------------

void QueryCache::Clear() {
  std::scoped_lock lock(mutex_);
  lru_.clear();
  index_.clear();
}

size_t QueryCache::Size() const {
  std::scoped_lock lock(mutex_);
  return lru_.size();
}

} // namespace causal::cache
