#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace registry::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode) : db_(std::move(db)), mode_(mode) {
  if (mode_ == TxMode::ReadOnly) {
    db_->Exec("PRAGMA query_only = ON;");
    try {
      db_->Exec("BEGIN DEFERRED;");
    } catch (const std::exception&) {
      db_->Exec("PRAGMA query_only = OFF;");
      throw;
    }
  } else {
    db_->Exec("BEGIN IMMEDIATE;");
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    Finish("ROLLBACK;");
  } catch (const std::exception& e) {
    REGISTRY_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) return;
  Finish("COMMIT;");
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  Finish("ROLLBACK;");
}

void SqliteTransaction::Finish(const char* sql) {
  finished_ = true;
  if (mode_ == TxMode::ReadWrite) {
    db_->Exec(sql);
    return;
  }
  try {
    db_->Exec(sql);
  } catch (const std::exception&) {
    db_->Exec("PRAGMA query_only = OFF;");
    throw;
  }
  db_->Exec("PRAGMA query_only = OFF;");
}

} // namespace registry::db::sqlite
