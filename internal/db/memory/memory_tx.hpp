#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace vkyc::db::memory {

/*
  Holds the repository's writer lock for its lifetime and works on a private
  copy of the committed state. Commit publishes the copy only if a mutating
  call touched it, so read-only transactions (GetSession, sweeps that find
  nothing to do) leave the committed state untouched.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return state_ == Phase::kCommitted;
  }

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  enum class Phase { kOpen, kCommitted, kRolledBack };

  void Finish(Phase phase);

  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> writer_;
  MemoryRepository::State      working_;
  Phase                        state_ = Phase::kOpen;
  bool                         dirty_ = false;
};

} // namespace vkyc::db::memory
