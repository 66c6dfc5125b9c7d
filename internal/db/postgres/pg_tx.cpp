#include "pg_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace registry::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode) : conn_(pool->Acquire()), mode_(mode) {
  tx_ = std::make_unique<pqxx::work>(*conn_);
  if (mode_ == TxMode::ReadOnly) {
    tx_->exec("SET TRANSACTION READ ONLY");
  }
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    REGISTRY_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  if (finished_) return;
  finished_ = true;
  // nothing to publish from a read-only transaction
  if (mode_ == TxMode::ReadOnly) {
    tx_->abort();
    return;
  }
  tx_->commit();
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

} // namespace registry::db::postgres
