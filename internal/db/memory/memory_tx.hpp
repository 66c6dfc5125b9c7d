#pragma once

#include <memory>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace registry::db::memory {

// Reads go to the snapshot taken at Begin. The first Mutable() call copies it
// into a private working state, which Commit publishes as the new snapshot.
class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);

  void   Commit() override;
  void   Rollback() override;
  TxMode Mode() const override {
    return mode_;
  }

  // Throws std::logic_error in a read-only transaction.
  MemoryRepository::State& Mutable();

  const MemoryRepository::State& View() const {
    return working_ ? *working_ : *snapshot_;
  }

 private:
  MemoryRepository&                              repo_;
  TxMode                                         mode_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::optional<MemoryRepository::State>         working_;
  bool                                           done_ = false;
};

} // namespace registry::db::memory
