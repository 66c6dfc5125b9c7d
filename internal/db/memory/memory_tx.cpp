#include "memory_tx.hpp"

#include <stdexcept>

namespace registry::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_ = repo_.committed_;
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (mode_ == TxMode::ReadOnly) {
    throw std::logic_error("memory repository: write in a read-only transaction");
  }
  if (done_) {
    throw std::logic_error("memory repository: transaction already finished");
  }
  if (!working_) {
    working_.emplace(*snapshot_);
  }
  return *working_;
}

void MemoryTransaction::Commit() {
  if (done_) return;
  done_ = true;
  if (!working_) return;

  std::scoped_lock lock(repo_.mutex_);
  // sections are serialized by StateStore, so another publish here is a bug
  if (repo_.committed_ != snapshot_) {
    throw std::runtime_error("memory repository: snapshot changed under an open write transaction");
  }
  repo_.committed_ = std::make_shared<const MemoryRepository::State>(std::move(*working_));
  working_.reset();
}

void MemoryTransaction::Rollback() {
  done_ = true;
  working_.reset();
}

} // namespace registry::db::memory
