#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace registry::db::memory {

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

template <typename Map, typename Key>
static std::optional<typename Map::mapped_type> Find(const Map& map, const Key& key) {
  auto it = map.find(key);
  if (it == map.end()) return std::nullopt;
  return it->second;
}

template <typename Map>
static std::vector<typename Map::mapped_type> Values(const Map& map) {
  std::vector<typename Map::mapped_type> out;
  out.reserve(map.size());
  for (const auto& [_, value] : map) {
    out.push_back(value);
  }
  return out;
}

// ------------------------------------------------------------------
// Seasons
// ------------------------------------------------------------------

Result MemoryRepository::InsertSeason(Transaction& t, model::SeasonRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id == 0) {
    r.id = s.next_season_id++;
  } else if (s.seasons.contains(r.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "season id " + std::to_string(r.id));
  } else {
    s.next_season_id = std::max(s.next_season_id, r.id + 1);
  }
  s.seasons[r.id] = r;
  return Result::Ok();
}

std::optional<model::SeasonRecord> MemoryRepository::GetSeason(Transaction& t, uint64_t id) {
  return Find(TX(t).View().seasons, id);
}

std::vector<model::SeasonRecord> MemoryRepository::ListSeasons(Transaction& t) {
  return Values(TX(t).View().seasons);
}

Result MemoryRepository::UpdateSeason(Transaction& t, const model::SeasonRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.seasons.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.seasons[r.id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Names
// ------------------------------------------------------------------

Result MemoryRepository::InsertName(Transaction& t, const model::NameRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.names.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "name " + r.name);
  if (s.owner_to_name.contains(r.owner)) return Result::Err(ErrorCode::AlreadyExists, "owner " + r.owner);
  s.names[r.name]          = r;
  s.owner_to_name[r.owner] = r.name;
  return Result::Ok();
}

std::optional<model::NameRecord> MemoryRepository::GetName(Transaction& t, const std::string& name) {
  return Find(TX(t).View().names, name);
}

std::optional<model::NameRecord> MemoryRepository::GetNameByOwner(Transaction& t, const std::string& owner) {
  const auto& s  = TX(t).View();
  auto        it = s.owner_to_name.find(owner);
  if (it == s.owner_to_name.end()) return std::nullopt;
  return Find(s.names, it->second);
}

std::vector<model::NameRecord> MemoryRepository::ListNames(Transaction& t) {
  return Values(TX(t).View().names);
}

uint64_t MemoryRepository::CountNamesInSeason(Transaction& t, uint64_t season_id) {
  const auto& names = TX(t).View().names;
  return static_cast<uint64_t>(
      std::count_if(names.begin(), names.end(), [season_id](const auto& entry) { return entry.second.season_id == season_id; }));
}

Result MemoryRepository::TouchName(Transaction& t, const std::string& name, uint64_t updated_at) {
  auto& s  = TX(t).Mutable();
  auto  it = s.names.find(name);
  if (it == s.names.end()) return Result::Err(ErrorCode::NotFound);
  it->second.updated_at = updated_at;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Roles and profiles
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRole(Transaction& t, const model::RoleRecord& r) {
  TX(t).Mutable().roles[r.principal] = r;
  return Result::Ok();
}

std::optional<model::RoleRecord> MemoryRepository::GetRole(Transaction& t, const std::string& principal) {
  return Find(TX(t).View().roles, principal);
}

std::vector<model::RoleRecord> MemoryRepository::ListRoles(Transaction& t) {
  return Values(TX(t).View().roles);
}

Result MemoryRepository::UpsertProfile(Transaction& t, const model::ProfileRecord& r) {
  TX(t).Mutable().profiles[r.principal] = r;
  return Result::Ok();
}

std::optional<model::ProfileRecord> MemoryRepository::GetProfile(Transaction& t, const std::string& principal) {
  return Find(TX(t).View().profiles, principal);
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

bool MemoryRepository::IsBlockConsumed(Transaction& t, uint64_t block_index) {
  return TX(t).View().consumed_blocks.contains(block_index);
}

Result MemoryRepository::InsertConsumedBlock(Transaction& t, uint64_t block_index, uint64_t consumed_at) {
  auto& s = TX(t).Mutable();
  if (!s.consumed_blocks.try_emplace(block_index, consumed_at).second) {
    return Result::Err(ErrorCode::AlreadyExists, "block " + std::to_string(block_index));
  }
  return Result::Ok();
}

std::vector<uint64_t> MemoryRepository::ListConsumedBlocks(Transaction& t) {
  std::vector<uint64_t> out;
  for (const auto& [block, _] : TX(t).View().consumed_blocks) {
    out.push_back(block);
  }
  return out;
}

Result MemoryRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.block_to_payment.contains(r.block_index)) {
    return Result::Err(ErrorCode::AlreadyExists, "payment for block " + std::to_string(r.block_index));
  }
  if (r.id == 0) {
    r.id = s.next_payment_id++;
  } else {
    s.next_payment_id = std::max(s.next_payment_id, r.id + 1);
  }
  s.payments[r.id]                 = r;
  s.block_to_payment[r.block_index] = r.id;
  return Result::Ok();
}

std::optional<model::PaymentRecord> MemoryRepository::GetPaymentByBlock(Transaction& t, uint64_t block_index) {
  const auto& s  = TX(t).View();
  auto        it = s.block_to_payment.find(block_index);
  if (it == s.block_to_payment.end()) return std::nullopt;
  return Find(s.payments, it->second);
}

std::vector<model::PaymentRecord> MemoryRepository::ListPayments(Transaction& t) {
  return Values(TX(t).View().payments);
}

std::vector<model::PaymentRecord> MemoryRepository::ListPaymentsByPayer(Transaction& t, const std::string& payer) {
  std::vector<model::PaymentRecord> out;
  for (const auto& [_, payment] : TX(t).View().payments) {
    if (payment.payer == payer) out.push_back(payment);
  }
  return out;
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.subscriptions.try_emplace(r.user, r).second) {
    return Result::Err(ErrorCode::AlreadyExists, "subscription for " + r.user);
  }
  return Result::Ok();
}

std::optional<model::SubscriptionRecord> MemoryRepository::GetSubscription(Transaction& t, const std::string& user) {
  return Find(TX(t).View().subscriptions, user);
}

std::vector<model::SubscriptionRecord> MemoryRepository::ListSubscriptions(Transaction& t) {
  return Values(TX(t).View().subscriptions);
}

Result MemoryRepository::DeactivateAllSubscriptions(Transaction& t) {
  for (auto& [_, subscription] : TX(t).Mutable().subscriptions) {
    subscription.is_active = false;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Content
// ------------------------------------------------------------------

Result MemoryRepository::UpsertMetadata(Transaction& t, const model::MetadataRecord& r) {
  TX(t).Mutable().metadata[r.name] = r;
  return Result::Ok();
}

std::optional<model::MetadataRecord> MemoryRepository::GetMetadata(Transaction& t, const std::string& name) {
  return Find(TX(t).View().metadata, name);
}

Result MemoryRepository::UpsertMarkdown(Transaction& t, const model::MarkdownRecord& r) {
  TX(t).Mutable().markdown[r.name] = r;
  return Result::Ok();
}

std::optional<model::MarkdownRecord> MemoryRepository::GetMarkdown(Transaction& t, const std::string& name) {
  return Find(TX(t).View().markdown, name);
}

} // namespace registry::db::memory
