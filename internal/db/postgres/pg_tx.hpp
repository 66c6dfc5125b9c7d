#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace registry::db::postgres {

// A pqxx::work on a pooled connection. Read sections run it READ ONLY so the
// server rejects stray writes.
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  TxMode Mode() const override { return mode_; }

private:
  // declared first so the work is destroyed before its connection is released
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  TxMode mode_;
  bool finished_ = false;
};

} // namespace registry::db::postgres
