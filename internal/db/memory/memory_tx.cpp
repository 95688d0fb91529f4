#include "memory_tx.hpp"

#include <algorithm>
#include <stdexcept>

namespace causal::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), owner_(std::this_thread::get_id()) {
  std::scoped_lock lock(repo_.mutex_);
  for (auto it = repo_.open_.rbegin(); it != repo_.open_.rend(); ++it) {
    if ((*it)->owner_ == owner_) {
      parent_ = *it;
      break;
    }
  }

  if (parent_) {
    working_ = parent_->working_;
  } else {
    working_          = repo_.committed_; // snapshot copy
    snapshot_version_ = repo_.committed_version_;
  }
  repo_.open_.push_back(this);
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Close() {
  auto it = std::find(repo_.open_.begin(), repo_.open_.end(), this);
  if (it != repo_.open_.end()) repo_.open_.erase(it);
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  if (!dirty_) {
    committed_ = true;
    Close();
    return;
  }
  if (parent_) {
    parent_->working_ = std::move(working_);
    parent_->dirty_   = true;
    committed_        = true;
    Close();
    return;
  }
  if (repo_.committed_version_ != snapshot_version_) {
    throw std::runtime_error("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
  Close();
}

void MemoryTransaction::Rollback() {
  std::scoped_lock lock(repo_.mutex_);
  rolled_back_ = true;
  Close();
}

} // namespace causal::db::memory
