#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/state_store.hpp"
#include "internal/db/model/name_record.hpp"

namespace registry::names {

/*
  NameLedger

  Registered names and their owners. A name is unique across the whole
  registry and an owner holds at most one name, ever. Records are never
  deleted.

  The transaction overloads are for callers already inside a StateStore
  section.
*/
class NameLedger {
 public:
  explicit NameLedger(std::shared_ptr<core::StateStore> store);

  bool IsNameTaken(const std::string& name);
  bool OwnerHasName(const std::string& owner);

  bool     IsNameTaken(db::Transaction& tx, const std::string& name);
  bool     OwnerHasName(db::Transaction& tx, const std::string& owner);
  uint64_t CountForSeason(db::Transaction& tx, uint64_t season_id);

  // Writes a record whose uniqueness the caller checked in the same section.
  void Commit(db::Transaction& tx, const db::model::NameRecord& record);

  // Bumps updated_at; throws NotFound for unknown names.
  void Touch(db::Transaction& tx, const std::string& name, uint64_t now);

  db::model::NameRecord                Get(const std::string& name);
  std::optional<db::model::NameRecord> Find(db::Transaction& tx, const std::string& name);
  std::vector<db::model::NameRecord>   List();

 private:
  std::shared_ptr<core::StateStore> store_;
};

} // namespace registry::names
