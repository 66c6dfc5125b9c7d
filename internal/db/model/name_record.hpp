#pragma once

#include <cstdint>
#include <string>

#include "registry/v1/types.pb.h"

namespace registry::db::model {

/*
  Registered name.

  name is unique system-wide and owner appears in at most one row.
  Rows are never deleted; only updated_at changes after insert.
*/

struct NameRecord {
  std::string name;
  std::string address;

  registry::v1::AddressType address_type = registry::v1::ADDRESS_TYPE_IDENTITY;

  std::string owner;

  // 0 when added by an admin outside any season
  uint64_t season_id = 0;

  uint64_t created_at = 0;
  uint64_t updated_at = 0;
};

} // namespace registry::db::model
