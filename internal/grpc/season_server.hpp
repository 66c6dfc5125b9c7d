#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/season_service.hpp"
#include "registry/v1/season_service.grpc.pb.h"

namespace registry::grpc {

class SeasonServer final : public registry::v1::SeasonService::Service {
 public:
  explicit SeasonServer(std::shared_ptr<registry::service::SeasonService> svc);

  ::grpc::Status CreateSeason(::grpc::ServerContext* context, const registry::v1::CreateSeasonRequest* req, registry::v1::CreateSeasonResponse* resp) override;
  ::grpc::Status ActivateSeason(::grpc::ServerContext* context, const registry::v1::SeasonIdRequest* req, google::protobuf::Empty* resp) override;
  ::grpc::Status EndSeason(::grpc::ServerContext* context, const registry::v1::SeasonIdRequest* req, google::protobuf::Empty* resp) override;
  ::grpc::Status CancelSeason(::grpc::ServerContext* context, const registry::v1::SeasonIdRequest* req, google::protobuf::Empty* resp) override;
  ::grpc::Status GetSeason(::grpc::ServerContext* context, const registry::v1::SeasonIdRequest* req, registry::v1::GetSeasonResponse* resp) override;
  ::grpc::Status ListSeasons(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::ListSeasonsResponse* resp) override;
  ::grpc::Status GetActiveSeason(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::GetSeasonResponse* resp) override;
  ::grpc::Status GetActiveSeasonInfo(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::ActiveSeasonInfo* resp) override;

 private:
  std::shared_ptr<registry::service::SeasonService> service_;
};

} // namespace registry::grpc
