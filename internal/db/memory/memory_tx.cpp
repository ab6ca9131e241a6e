#include "memory_tx.hpp"

#include <stdexcept>

namespace vkyc::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_(repo.write_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() {
  if (state_ == Phase::kOpen) {
    Finish(Phase::kRolledBack);
  }
}

void MemoryTransaction::Commit() {
  if (state_ != Phase::kOpen) {
    throw std::logic_error("memory transaction already finished");
  }
  if (dirty_) {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = std::move(working_);
  }
  Finish(Phase::kCommitted);
}

void MemoryTransaction::Rollback() {
  if (state_ != Phase::kOpen) {
    return;
  }
  Finish(Phase::kRolledBack);
}

void MemoryTransaction::Finish(Phase phase) {
  state_ = phase;
  dirty_ = false;
  if (writer_.owns_lock()) {
    writer_.unlock();
  }
}

} // namespace vkyc::db::memory
