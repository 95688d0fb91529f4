#pragma once

#include <thread>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace causal::db::memory {

/*
  Transaction = snapshot + write set

  Opened while the same thread holds another transaction, it snapshots
  the outer one's working state instead of the committed state, and its
  commit folds back into the outer transaction.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  bool IsNested() const {
    return parent_ != nullptr;
  }

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  // caller holds repo_.mutex_
  void Close();

  MemoryRepository&       repo_;
  MemoryTransaction*      parent_ = nullptr;
  std::thread::id         owner_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
  bool                    dirty_            = false;
};

} // namespace causal::db::memory
