#include "name_ledger.hpp"

#include "internal/util/errors.hpp"

namespace registry::names {

NameLedger::NameLedger(std::shared_ptr<core::StateStore> store) : store_(std::move(store)) {
}

bool NameLedger::IsNameTaken(const std::string& name) {
  return store_->Read([&](db::Transaction& tx) { return IsNameTaken(tx, name); });
}

bool NameLedger::OwnerHasName(const std::string& owner) {
  return store_->Read([&](db::Transaction& tx) { return OwnerHasName(tx, owner); });
}

bool NameLedger::IsNameTaken(db::Transaction& tx, const std::string& name) {
  return store_->Repo().GetName(tx, name).has_value();
}

bool NameLedger::OwnerHasName(db::Transaction& tx, const std::string& owner) {
  return store_->Repo().GetNameByOwner(tx, owner).has_value();
}

uint64_t NameLedger::CountForSeason(db::Transaction& tx, uint64_t season_id) {
  return store_->Repo().CountNamesInSeason(tx, season_id);
}

void NameLedger::Commit(db::Transaction& tx, const db::model::NameRecord& record) {
  auto result = store_->Repo().InsertName(tx, record);
  if (result.code == db::ErrorCode::AlreadyExists) {
    // both keys were checked by the caller; report whichever still collides
    if (OwnerHasName(tx, record.owner)) throw util::AlreadyRegistered("owner " + record.owner + " already holds a name");
    throw util::NameTaken("name " + record.name + " is taken");
  }
  core::ThrowIfDbError(result, "insert name");
}

void NameLedger::Touch(db::Transaction& tx, const std::string& name, uint64_t now) {
  auto result = store_->Repo().TouchName(tx, name, now);
  if (result.code == db::ErrorCode::NotFound) {
    throw util::NotFound("name " + name);
  }
  core::ThrowIfDbError(result, "touch name");
}

db::model::NameRecord NameLedger::Get(const std::string& name) {
  auto record = store_->Read([&](db::Transaction& tx) { return Find(tx, name); });
  if (!record) {
    throw util::NotFound("name " + name);
  }
  return *record;
}

std::optional<db::model::NameRecord> NameLedger::Find(db::Transaction& tx, const std::string& name) {
  return store_->Repo().GetName(tx, name);
}

std::vector<db::model::NameRecord> NameLedger::List() {
  return store_->Read([&](db::Transaction& tx) { return store_->Repo().ListNames(tx); });
}

} // namespace registry::names
