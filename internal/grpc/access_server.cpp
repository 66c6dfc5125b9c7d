#include "access_server.hpp"

#include "grpc_error.hpp"

namespace registry::grpc {

AccessServer::AccessServer(std::shared_ptr<registry::service::AccessService> svc) : service_(std::move(svc)) {
}

::grpc::Status AccessServer::InitializeAccessControl(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::RoleResponse* resp) {
  return Serve([&] { *resp = service_->InitializeAccessControl(CallerOf(context)); });
}

::grpc::Status AccessServer::GetCallerRole(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::RoleResponse* resp) {
  return Serve([&] { *resp = service_->GetCallerRole(CallerOf(context)); });
}

::grpc::Status AccessServer::AssignRole(::grpc::ServerContext* context, const registry::v1::AssignRoleRequest* req, google::protobuf::Empty*) {
  return Serve([&] { service_->AssignRole(CallerOf(context), *req); });
}

::grpc::Status AccessServer::IsCallerAdmin(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::IsAdminResponse* resp) {
  return Serve([&] { *resp = service_->IsCallerAdmin(CallerOf(context)); });
}

::grpc::Status AccessServer::ListAdmins(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::ListAdminsResponse* resp) {
  return Serve([&] { *resp = service_->ListAdmins(CallerOf(context)); });
}

::grpc::Status AccessServer::SaveCallerProfile(::grpc::ServerContext* context, const registry::v1::SaveProfileRequest* req, google::protobuf::Empty*) {
  return Serve([&] { service_->SaveCallerProfile(CallerOf(context), *req); });
}

::grpc::Status AccessServer::GetCallerProfile(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::GetProfileResponse* resp) {
  return Serve([&] { *resp = service_->GetCallerProfile(CallerOf(context)); });
}

::grpc::Status AccessServer::GetUserProfile(::grpc::ServerContext* context, const registry::v1::GetProfileRequest* req, registry::v1::GetProfileResponse* resp) {
  return Serve([&] { *resp = service_->GetUserProfile(CallerOf(context), *req); });
}

} // namespace registry::grpc
