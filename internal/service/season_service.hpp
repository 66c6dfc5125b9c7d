#pragma once

#include <string>

#include <google/protobuf/empty.pb.h>

#include "registry/v1/season_service.pb.h"
#include "service_context.hpp"

namespace registry::service {

class SeasonService {
 public:
  explicit SeasonService(ServiceContext ctx);

  registry::v1::CreateSeasonResponse CreateSeason(const std::string& caller, const registry::v1::CreateSeasonRequest& req);

  void ActivateSeason(const std::string& caller, const registry::v1::SeasonIdRequest& req);
  void EndSeason(const std::string& caller, const registry::v1::SeasonIdRequest& req);
  void CancelSeason(const std::string& caller, const registry::v1::SeasonIdRequest& req);

  registry::v1::GetSeasonResponse   GetSeason(const std::string& caller, const registry::v1::SeasonIdRequest& req);
  registry::v1::ListSeasonsResponse ListSeasons(const std::string& caller);
  registry::v1::GetSeasonResponse   GetActiveSeason(const std::string& caller);
  registry::v1::ActiveSeasonInfo    GetActiveSeasonInfo(const std::string& caller);

 private:
  ServiceContext ctx_;
};

} // namespace registry::service
