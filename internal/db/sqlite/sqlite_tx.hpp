#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace registry::db::sqlite {

/*
  SQLite transaction wrapper.

  ReadWrite: BEGIN IMMEDIATE, the write lock is taken up front so a section
             never fails half way on SQLITE_BUSY.
  ReadOnly:  BEGIN DEFERRED with PRAGMA query_only set for its duration.

  One connection carries one transaction, so transactions on the same
  SqliteDB must not overlap. StateStore guarantees that.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  TxMode Mode() const override { return mode_; }

private:
  void Finish(const char* sql);

  std::shared_ptr<SqliteDB> db_;
  TxMode mode_;
  bool finished_ = false;
};

} // namespace registry::db::sqlite
