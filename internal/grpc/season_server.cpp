#include "season_server.hpp"

#include "grpc_error.hpp"

namespace registry::grpc {

SeasonServer::SeasonServer(std::shared_ptr<registry::service::SeasonService> svc) : service_(std::move(svc)) {
}

::grpc::Status SeasonServer::CreateSeason(::grpc::ServerContext* context, const registry::v1::CreateSeasonRequest* req, registry::v1::CreateSeasonResponse* resp) {
  return Serve([&] { *resp = service_->CreateSeason(CallerOf(context), *req); });
}

::grpc::Status SeasonServer::ActivateSeason(::grpc::ServerContext* context, const registry::v1::SeasonIdRequest* req, google::protobuf::Empty*) {
  return Serve([&] { service_->ActivateSeason(CallerOf(context), *req); });
}

::grpc::Status SeasonServer::EndSeason(::grpc::ServerContext* context, const registry::v1::SeasonIdRequest* req, google::protobuf::Empty*) {
  return Serve([&] { service_->EndSeason(CallerOf(context), *req); });
}

::grpc::Status SeasonServer::CancelSeason(::grpc::ServerContext* context, const registry::v1::SeasonIdRequest* req, google::protobuf::Empty*) {
  return Serve([&] { service_->CancelSeason(CallerOf(context), *req); });
}

::grpc::Status SeasonServer::GetSeason(::grpc::ServerContext* context, const registry::v1::SeasonIdRequest* req, registry::v1::GetSeasonResponse* resp) {
  return Serve([&] { *resp = service_->GetSeason(CallerOf(context), *req); });
}

::grpc::Status SeasonServer::ListSeasons(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::ListSeasonsResponse* resp) {
  return Serve([&] { *resp = service_->ListSeasons(CallerOf(context)); });
}

::grpc::Status SeasonServer::GetActiveSeason(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::GetSeasonResponse* resp) {
  return Serve([&] { *resp = service_->GetActiveSeason(CallerOf(context)); });
}

::grpc::Status SeasonServer::GetActiveSeasonInfo(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::ActiveSeasonInfo* resp) {
  return Serve([&] { *resp = service_->GetActiveSeasonInfo(CallerOf(context)); });
}

} // namespace registry::grpc
