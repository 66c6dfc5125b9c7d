#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/access_service.hpp"
#include "registry/v1/access_service.grpc.pb.h"

namespace registry::grpc {

class AccessServer final : public registry::v1::AccessService::Service {
 public:
  explicit AccessServer(std::shared_ptr<registry::service::AccessService> svc);

  ::grpc::Status InitializeAccessControl(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::RoleResponse* resp) override;
  ::grpc::Status GetCallerRole(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::RoleResponse* resp) override;
  ::grpc::Status AssignRole(::grpc::ServerContext* context, const registry::v1::AssignRoleRequest* req, google::protobuf::Empty* resp) override;
  ::grpc::Status IsCallerAdmin(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::IsAdminResponse* resp) override;
  ::grpc::Status ListAdmins(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::ListAdminsResponse* resp) override;
  ::grpc::Status SaveCallerProfile(::grpc::ServerContext* context, const registry::v1::SaveProfileRequest* req, google::protobuf::Empty* resp) override;
  ::grpc::Status GetCallerProfile(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::GetProfileResponse* resp) override;
  ::grpc::Status GetUserProfile(::grpc::ServerContext* context, const registry::v1::GetProfileRequest* req, registry::v1::GetProfileResponse* resp) override;

 private:
  std::shared_ptr<registry::service::AccessService> service_;
};

} // namespace registry::grpc
