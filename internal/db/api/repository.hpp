#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/content_record.hpp"
#include "internal/db/model/name_record.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/db/model/role_record.hpp"
#include "internal/db/model/season_record.hpp"
#include "internal/db/model/subscription_record.hpp"

namespace registry::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Id assignment (seasons, payments) is monotonic and never reuses an id
  - Inserting a duplicate key returns ErrorCode::AlreadyExists and leaves
    the transaction usable

  The DB is the source of truth for:
    seasons and their status
    registered names
    consumed ledger blocks and verified payments
    roles
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode) = 0;

  // ---------------------------------------------------------------------
  // Seasons
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertSeason(Transaction&, model::SeasonRecord&) = 0;

  virtual std::optional<model::SeasonRecord> GetSeason(Transaction&, uint64_t id) = 0;

  // Ordered by id.
  virtual std::vector<model::SeasonRecord> ListSeasons(Transaction&) = 0;

  virtual Result UpdateSeason(Transaction&, const model::SeasonRecord&) = 0;

  // ---------------------------------------------------------------------
  // Names
  // ---------------------------------------------------------------------

  virtual Result InsertName(Transaction&, const model::NameRecord&) = 0;

  virtual std::optional<model::NameRecord> GetName(Transaction&, const std::string& name) = 0;

  virtual std::optional<model::NameRecord> GetNameByOwner(Transaction&, const std::string& owner) = 0;

  // Ordered by name.
  virtual std::vector<model::NameRecord> ListNames(Transaction&) = 0;

  virtual uint64_t CountNamesInSeason(Transaction&, uint64_t season_id) = 0;

  virtual Result TouchName(Transaction&, const std::string& name, uint64_t updated_at) = 0;

  // ---------------------------------------------------------------------
  // Roles and profiles
  // ---------------------------------------------------------------------

  virtual Result UpsertRole(Transaction&, const model::RoleRecord&) = 0;

  virtual std::optional<model::RoleRecord> GetRole(Transaction&, const std::string& principal) = 0;

  virtual std::vector<model::RoleRecord> ListRoles(Transaction&) = 0;

  virtual Result UpsertProfile(Transaction&, const model::ProfileRecord&) = 0;

  virtual std::optional<model::ProfileRecord> GetProfile(Transaction&, const std::string& principal) = 0;

  // ---------------------------------------------------------------------
  // Payments
  // ---------------------------------------------------------------------

  virtual bool IsBlockConsumed(Transaction&, uint64_t block_index) = 0;

  // AlreadyExists if the block was consumed before.
  virtual Result InsertConsumedBlock(Transaction&, uint64_t block_index, uint64_t consumed_at) = 0;

  virtual std::vector<uint64_t> ListConsumedBlocks(Transaction&) = 0;

  // Assigns record.id.
  virtual Result InsertPayment(Transaction&, model::PaymentRecord&) = 0;

  virtual std::optional<model::PaymentRecord> GetPaymentByBlock(Transaction&, uint64_t block_index) = 0;

  // Ordered by id.
  virtual std::vector<model::PaymentRecord> ListPayments(Transaction&) = 0;

  virtual std::vector<model::PaymentRecord> ListPaymentsByPayer(Transaction&, const std::string& payer) = 0;

  // ---------------------------------------------------------------------
  // Subscriptions
  // ---------------------------------------------------------------------

  virtual Result InsertSubscription(Transaction&, const model::SubscriptionRecord&) = 0;

  virtual std::optional<model::SubscriptionRecord> GetSubscription(Transaction&, const std::string& user) = 0;

  virtual std::vector<model::SubscriptionRecord> ListSubscriptions(Transaction&) = 0;

  virtual Result DeactivateAllSubscriptions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Content (current snapshot)
  // ---------------------------------------------------------------------

  virtual Result UpsertMetadata(Transaction&, const model::MetadataRecord&) = 0;

  virtual std::optional<model::MetadataRecord> GetMetadata(Transaction&, const std::string& name) = 0;

  virtual Result UpsertMarkdown(Transaction&, const model::MarkdownRecord&) = 0;

  virtual std::optional<model::MarkdownRecord> GetMarkdown(Transaction&, const std::string& name) = 0;
};

} // namespace registry::db
