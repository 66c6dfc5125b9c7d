#pragma once

#include "registry/v1/types.pb.h"

namespace registry::season {

/*
  Season lifecycle:

    DRAFT -> ACTIVE -> ENDED
                   \-> CANCELLED
*/

constexpr bool CanTransition(registry::v1::SeasonStatus from, registry::v1::SeasonStatus to) {
  switch (from) {
    case registry::v1::SEASON_STATUS_DRAFT:
      return to == registry::v1::SEASON_STATUS_ACTIVE;
    case registry::v1::SEASON_STATUS_ACTIVE:
      return to == registry::v1::SEASON_STATUS_ENDED || to == registry::v1::SEASON_STATUS_CANCELLED;
    case registry::v1::SEASON_STATUS_ENDED:
    case registry::v1::SEASON_STATUS_CANCELLED:
    case registry::v1::SEASON_STATUS_UNSPECIFIED:
    default:
      return false;
  }
}

static_assert(CanTransition(registry::v1::SEASON_STATUS_DRAFT, registry::v1::SEASON_STATUS_ACTIVE));
static_assert(!CanTransition(registry::v1::SEASON_STATUS_DRAFT, registry::v1::SEASON_STATUS_ENDED));
static_assert(!CanTransition(registry::v1::SEASON_STATUS_ENDED, registry::v1::SEASON_STATUS_ACTIVE));

} // namespace registry::season
