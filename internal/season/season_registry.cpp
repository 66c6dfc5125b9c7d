#include "season_registry.hpp"

#include "internal/observability/logging.hpp"
#include "internal/season/season_state.hpp"
#include "internal/util/errors.hpp"

namespace registry::season {

using db::model::SeasonRecord;
using registry::v1::SeasonStatus;

SeasonRegistry::SeasonRegistry(std::shared_ptr<core::StateStore> store, std::shared_ptr<access::AccessControl> access,
                               std::shared_ptr<names::NameLedger> names, util::NowFn now)
    : store_(std::move(store)), access_(std::move(access)), names_(std::move(names)), now_(std::move(now)) {
}

uint64_t SeasonRegistry::Create(const std::string& caller, const SeasonParams& params) {
  const auto id = store_->Write([&](db::Transaction& tx) {
    access_->Require(tx, caller, registry::v1::USER_ROLE_ADMIN);

    if (params.start_time >= params.end_time) {
      throw util::InvalidRange("start_time must be before end_time");
    }
    if (params.min_name_length > params.max_name_length) {
      throw util::InvalidRange("min_name_length exceeds max_name_length");
    }
    if (params.price == 0) {
      throw util::InvalidRange("price must be positive");
    }

    const auto   now = now_();
    SeasonRecord record;
    record.name            = params.name;
    record.start_time      = params.start_time;
    record.end_time        = params.end_time;
    record.max_names       = params.max_names;
    record.min_name_length = params.min_name_length;
    record.max_name_length = params.max_name_length;
    record.price           = params.price;
    record.status          = registry::v1::SEASON_STATUS_DRAFT;
    record.created_at      = now;
    record.updated_at      = now;
    core::ThrowIfDbError(store_->Repo().InsertSeason(tx, record), "insert season");
    return record.id;
  });

  REGISTRY_LOG_INFO("season created", {observability::UintField("season_id", id), observability::StringField("name", params.name),
                                       observability::UintField("max_names", params.max_names)});
  return id;
}

void SeasonRegistry::Activate(const std::string& caller, uint64_t id) {
  Transition(caller, id, registry::v1::SEASON_STATUS_ACTIVE);
}

void SeasonRegistry::End(const std::string& caller, uint64_t id) {
  Transition(caller, id, registry::v1::SEASON_STATUS_ENDED);
}

void SeasonRegistry::Cancel(const std::string& caller, uint64_t id) {
  Transition(caller, id, registry::v1::SEASON_STATUS_CANCELLED);
}

void SeasonRegistry::Transition(const std::string& caller, uint64_t id, SeasonStatus to) {
  store_->Write([&](db::Transaction& tx) {
    access_->Require(tx, caller, registry::v1::USER_ROLE_ADMIN);

    auto season = Find(tx, id);
    if (!season) {
      throw util::NotFound("season " + std::to_string(id));
    }

    if (to == registry::v1::SEASON_STATUS_ACTIVE) {
      if (auto active = FindActive(tx); active && active->id != id) {
        throw util::AlreadyActive("season " + std::to_string(active->id) + " is already active");
      }
      if (season->status != registry::v1::SEASON_STATUS_DRAFT) {
        throw util::NotDraft("season " + std::to_string(id) + " is " + registry::v1::SeasonStatus_Name(season->status));
      }
    } else if (season->status != registry::v1::SEASON_STATUS_ACTIVE) {
      throw util::NotActive("season " + std::to_string(id) + " is " + registry::v1::SeasonStatus_Name(season->status));
    }

    if (!CanTransition(season->status, to)) {
      throw util::NotActive("season " + std::to_string(id) + " cannot move to " + registry::v1::SeasonStatus_Name(to));
    }

    season->status     = to;
    season->updated_at = now_();
    core::ThrowIfDbError(store_->Repo().UpdateSeason(tx, *season), "update season");
  });

  REGISTRY_LOG_INFO("season status changed",
                    {observability::UintField("season_id", id), observability::StringField("status", registry::v1::SeasonStatus_Name(to))});
}

SeasonRecord SeasonRegistry::Get(uint64_t id) {
  auto season = store_->Read([&](db::Transaction& tx) { return Find(tx, id); });
  if (!season) {
    throw util::NotFound("season " + std::to_string(id));
  }
  return *season;
}

std::vector<SeasonRecord> SeasonRegistry::List() {
  return store_->Read([&](db::Transaction& tx) { return store_->Repo().ListSeasons(tx); });
}

SeasonRecord SeasonRegistry::Active() {
  auto season = store_->Read([&](db::Transaction& tx) { return FindActive(tx); });
  if (!season) {
    throw util::NoActiveSeason("no season is active");
  }
  return *season;
}

ActiveSeasonInfo SeasonRegistry::ActiveInfo() {
  return store_->Read([&](db::Transaction& tx) {
    auto season = FindActive(tx);
    if (!season) {
      throw util::NoActiveSeason("no season is active");
    }

    const auto       used = names_->CountForSeason(tx, season->id);
    ActiveSeasonInfo info;
    info.available_names = season->max_names > used ? season->max_names - used : 0;
    info.price           = season->price;
    info.season          = std::move(*season);
    return info;
  });
}

std::optional<SeasonRecord> SeasonRegistry::FindActive(db::Transaction& tx) {
  for (auto& season : store_->Repo().ListSeasons(tx)) {
    if (season.status == registry::v1::SEASON_STATUS_ACTIVE) return season;
  }
  return std::nullopt;
}

std::optional<SeasonRecord> SeasonRegistry::Find(db::Transaction& tx, uint64_t id) {
  return store_->Repo().GetSeason(tx, id);
}

void SeasonRegistry::RequireOpen(db::Transaction& tx, const SeasonRecord& season, uint64_t now) {
  const auto id = std::to_string(season.id);
  if (season.status != registry::v1::SEASON_STATUS_ACTIVE) {
    throw util::SeasonNotOpen("season " + id + " is " + registry::v1::SeasonStatus_Name(season.status));
  }
  if (now < season.start_time || now > season.end_time) {
    throw util::SeasonNotOpen("season " + id + " is outside its registration window");
  }
  if (names_->CountForSeason(tx, season.id) >= season.max_names) {
    throw util::SeasonNotOpen("season " + id + " has no names left");
  }
}

} // namespace registry::season
