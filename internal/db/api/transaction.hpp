#pragma once

namespace registry::db {

enum class TxMode {
  ReadWrite,
  // StateStore::Read sections. Backends refuse writes where they can.
  ReadOnly,
};

/*
  One repository transaction. Always owned by a single StateStore section.

  All backends:
  - writes stay invisible to other transactions until Commit()
  - Rollback(), or destruction before Commit(), discards them
  - Commit() on a ReadOnly transaction just ends it

  SQLite:   BEGIN IMMEDIATE, or BEGIN DEFERRED under query_only for reads
  Postgres: pqxx::work, SET TRANSACTION READ ONLY for reads
  Memory:   shared snapshot, copied on the first write
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual TxMode Mode() const = 0;
};

} // namespace registry::db
