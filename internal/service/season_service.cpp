#include "season_service.hpp"

#include "internal/season/season_registry.hpp"
#include "observe_rpc.hpp"
#include "record_convert.hpp"

namespace registry::service {

using namespace registry::v1;

SeasonService::SeasonService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateSeasonResponse SeasonService::CreateSeason(const std::string& caller, const CreateSeasonRequest& req) {
  return ObserveRpc("SeasonService.CreateSeason", caller, [&] {
    season::SeasonParams params;
    params.name            = req.name();
    params.start_time      = req.start_time();
    params.end_time        = req.end_time();
    params.max_names       = req.max_names();
    params.min_name_length = req.min_name_length();
    params.max_name_length = req.max_name_length();
    params.price           = req.price();

    CreateSeasonResponse resp;
    resp.set_id(ctx_.seasons->Create(caller, params));
    return resp;
  });
}

void SeasonService::ActivateSeason(const std::string& caller, const SeasonIdRequest& req) {
  ObserveRpc("SeasonService.ActivateSeason", caller, [&] { ctx_.seasons->Activate(caller, req.id()); });
}

void SeasonService::EndSeason(const std::string& caller, const SeasonIdRequest& req) {
  ObserveRpc("SeasonService.EndSeason", caller, [&] { ctx_.seasons->End(caller, req.id()); });
}

void SeasonService::CancelSeason(const std::string& caller, const SeasonIdRequest& req) {
  ObserveRpc("SeasonService.CancelSeason", caller, [&] { ctx_.seasons->Cancel(caller, req.id()); });
}

GetSeasonResponse SeasonService::GetSeason(const std::string& caller, const SeasonIdRequest& req) {
  return ObserveRpc("SeasonService.GetSeason", caller, [&] {
    GetSeasonResponse resp;
    *resp.mutable_season() = ToProto(ctx_.seasons->Get(req.id()));
    return resp;
  });
}

ListSeasonsResponse SeasonService::ListSeasons(const std::string& caller) {
  return ObserveRpc("SeasonService.ListSeasons", caller, [&] {
    ListSeasonsResponse resp;
    for (const auto& record : ctx_.seasons->List()) {
      *resp.add_seasons() = ToProto(record);
    }
    return resp;
  });
}

GetSeasonResponse SeasonService::GetActiveSeason(const std::string& caller) {
  return ObserveRpc("SeasonService.GetActiveSeason", caller, [&] {
    GetSeasonResponse resp;
    *resp.mutable_season() = ToProto(ctx_.seasons->Active());
    return resp;
  });
}

registry::v1::ActiveSeasonInfo SeasonService::GetActiveSeasonInfo(const std::string& caller) {
  return ObserveRpc("SeasonService.GetActiveSeasonInfo", caller, [&] {
    const auto info = ctx_.seasons->ActiveInfo();

    registry::v1::ActiveSeasonInfo resp;
    *resp.mutable_season() = ToProto(info.season);
    resp.set_available_names(info.available_names);
    resp.set_price(info.price);
    return resp;
  });
}

} // namespace registry::service
