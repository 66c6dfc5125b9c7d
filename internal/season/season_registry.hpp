#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/access/access_control.hpp"
#include "internal/core/state_store.hpp"
#include "internal/db/model/season_record.hpp"
#include "internal/names/name_ledger.hpp"
#include "internal/util/time.hpp"

namespace registry::season {

struct SeasonParams {
  std::string name;
  uint64_t    start_time      = 0;
  uint64_t    end_time        = 0;
  uint64_t    max_names       = 0;
  uint64_t    min_name_length = 0;
  uint64_t    max_name_length = 0;
  uint64_t    price           = 0;
};

struct ActiveSeasonInfo {
  db::model::SeasonRecord season;
  uint64_t                available_names = 0;
  uint64_t                price           = 0;
};

/*
  SeasonRegistry

  Owns seasons and their lifecycle. At most one season is ACTIVE at any
  instant; Activate checks that inside the same write section that flips
  the status.
*/
class SeasonRegistry {
 public:
  SeasonRegistry(std::shared_ptr<core::StateStore> store, std::shared_ptr<access::AccessControl> access,
                 std::shared_ptr<names::NameLedger> names, util::NowFn now = util::SystemClock());

  uint64_t Create(const std::string& caller, const SeasonParams& params);
  void     Activate(const std::string& caller, uint64_t id);
  void     End(const std::string& caller, uint64_t id);
  void     Cancel(const std::string& caller, uint64_t id);

  db::model::SeasonRecord              Get(uint64_t id);
  std::vector<db::model::SeasonRecord> List();
  db::model::SeasonRecord              Active();
  ActiveSeasonInfo                     ActiveInfo();

  std::optional<db::model::SeasonRecord> FindActive(db::Transaction& tx);
  std::optional<db::model::SeasonRecord> Find(db::Transaction& tx, uint64_t id);

  // Throws SeasonNotOpen unless season is ACTIVE, now lies in
  // [start_time, end_time] and at least one name slot is free.
  void RequireOpen(db::Transaction& tx, const db::model::SeasonRecord& season, uint64_t now);

 private:
  void Transition(const std::string& caller, uint64_t id, registry::v1::SeasonStatus to);

  std::shared_ptr<core::StateStore>      store_;
  std::shared_ptr<access::AccessControl> access_;
  std::shared_ptr<names::NameLedger>     names_;
  util::NowFn                            now_;
};

} // namespace registry::season
