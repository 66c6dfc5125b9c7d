#pragma once

#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/transaction.hpp"

namespace registry::core {

/*
  StateStore

  Single owner of registry state. Every section runs on its own repository
  transaction while holding the store mutex, so at most one section is in
  flight at a time:

    Write(fn)  commits when fn returns, rolls back when fn throws
    Read(fn)   runs on a read-only transaction that is discarded

  Nothing that can block on the network may run inside a section. Callers
  that need the external ledger query it between two sections and re-check
  what they read in the first one.
*/
class StateStore {
 public:
  explicit StateStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  }

  StateStore(const StateStore&)            = delete;
  StateStore& operator=(const StateStore&) = delete;

  db::Repository& Repo() {
    return *repository_;
  }

  template <typename Fn>
  auto Write(Fn&& fn) -> std::invoke_result_t<Fn, db::Transaction&> {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin(db::TxMode::ReadWrite);
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, db::Transaction&>>) {
      std::forward<Fn>(fn)(*tx);
      tx->Commit();
    } else {
      auto result = std::forward<Fn>(fn)(*tx);
      tx->Commit();
      return result;
    }
  }

  template <typename Fn>
  auto Read(Fn&& fn) -> std::invoke_result_t<Fn, db::Transaction&> {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin(db::TxMode::ReadOnly);
    return std::forward<Fn>(fn)(*tx);
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  std::mutex                      mutex_;
};

// Converts a failed repository result into an exception.
void ThrowIfDbError(const db::Result& result, const char* what);

} // namespace registry::core
