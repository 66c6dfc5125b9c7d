#pragma once

#include <cstdint>
#include <string>

namespace registry::db::model {

/*
  A ledger transfer that funded exactly one registration.
  Append-only. block_index is unique across all rows.
*/

struct PaymentRecord {
  // assigned on insert (0 = unassigned)
  uint64_t id = 0;

  std::string payer;
  uint64_t    amount      = 0;
  uint64_t    block_index = 0;
  uint64_t    verified_at = 0;

  std::string registration_name;
};

} // namespace registry::db::model
