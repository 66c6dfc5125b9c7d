#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace registry::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin(TxMode mode) override;
  Result InsertSeason(Transaction&, model::SeasonRecord&) override;
  std::optional<model::SeasonRecord> GetSeason(Transaction&, uint64_t id) override;
  std::vector<model::SeasonRecord> ListSeasons(Transaction&) override;
  Result UpdateSeason(Transaction&, const model::SeasonRecord&) override;

  Result InsertName(Transaction&, const model::NameRecord&) override;
  std::optional<model::NameRecord> GetName(Transaction&, const std::string& name) override;
  std::optional<model::NameRecord> GetNameByOwner(Transaction&, const std::string& owner) override;
  std::vector<model::NameRecord> ListNames(Transaction&) override;
  uint64_t CountNamesInSeason(Transaction&, uint64_t season_id) override;
  Result TouchName(Transaction&, const std::string& name, uint64_t updated_at) override;

  Result UpsertRole(Transaction&, const model::RoleRecord&) override;
  std::optional<model::RoleRecord> GetRole(Transaction&, const std::string& principal) override;
  std::vector<model::RoleRecord> ListRoles(Transaction&) override;
  Result UpsertProfile(Transaction&, const model::ProfileRecord&) override;
  std::optional<model::ProfileRecord> GetProfile(Transaction&, const std::string& principal) override;

  bool IsBlockConsumed(Transaction&, uint64_t block_index) override;
  Result InsertConsumedBlock(Transaction&, uint64_t block_index, uint64_t consumed_at) override;
  std::vector<uint64_t> ListConsumedBlocks(Transaction&) override;
  Result InsertPayment(Transaction&, model::PaymentRecord&) override;
  std::optional<model::PaymentRecord> GetPaymentByBlock(Transaction&, uint64_t block_index) override;
  std::vector<model::PaymentRecord> ListPayments(Transaction&) override;
  std::vector<model::PaymentRecord> ListPaymentsByPayer(Transaction&, const std::string& payer) override;

  Result InsertSubscription(Transaction&, const model::SubscriptionRecord&) override;
  std::optional<model::SubscriptionRecord> GetSubscription(Transaction&, const std::string& user) override;
  std::vector<model::SubscriptionRecord> ListSubscriptions(Transaction&) override;
  Result DeactivateAllSubscriptions(Transaction&) override;

  Result UpsertMetadata(Transaction&, const model::MetadataRecord&) override;
  std::optional<model::MetadataRecord> GetMetadata(Transaction&, const std::string& name) override;
  Result UpsertMarkdown(Transaction&, const model::MarkdownRecord&) override;
  std::optional<model::MarkdownRecord> GetMarkdown(Transaction&, const std::string& name) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static Result NextId(sqlite3* db, const char* counter, uint64_t& id);
};

}
