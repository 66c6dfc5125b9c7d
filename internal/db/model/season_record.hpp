#pragma once

#include <cstdint>
#include <string>

#include "registry/v1/types.pb.h"

namespace registry::db::model {

/*
  Persistent season row.

  IMPORTANT:
  - id is assigned by the repository on insert (0 = unassigned) and is
    never reused.
  - At most one row may carry SEASON_STATUS_ACTIVE. The repository does not
    enforce this; SeasonRegistry does inside a write section.
*/

struct SeasonRecord {
  uint64_t    id = 0;
  std::string name;

  // window, ns since epoch
  uint64_t start_time = 0;
  uint64_t end_time   = 0;

  uint64_t max_names       = 0;
  uint64_t min_name_length = 0;
  uint64_t max_name_length = 0;

  // ledger base units
  uint64_t price = 0;

  registry::v1::SeasonStatus status = registry::v1::SEASON_STATUS_DRAFT;

  uint64_t created_at = 0;
  uint64_t updated_at = 0;
};

} // namespace registry::db::model
