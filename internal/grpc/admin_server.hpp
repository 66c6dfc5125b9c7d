#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/admin_service.hpp"
#include "registry/v1/admin_service.grpc.pb.h"

namespace registry::grpc {

class AdminServer final : public registry::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<registry::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::StatsResponse* resp) override;
  ::grpc::Status ListPayments(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::ListPaymentsResponse* resp) override;
  ::grpc::Status PauseAllSubscriptions(::grpc::ServerContext* context, const google::protobuf::Empty* req, google::protobuf::Empty* resp) override;
  ::grpc::Status ValidateSystemState(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::ValidateSystemStateResponse* resp) override;

 private:
  std::shared_ptr<registry::service::AdminService> service_;
};

} // namespace registry::grpc
