#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace registry::grpc {

AdminServer::AdminServer(std::shared_ptr<registry::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::StatsResponse* resp) {
  return Serve([&] { *resp = service_->Stats(CallerOf(context)); });
}

::grpc::Status AdminServer::ListPayments(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::ListPaymentsResponse* resp) {
  return Serve([&] { *resp = service_->ListPayments(CallerOf(context)); });
}

::grpc::Status AdminServer::PauseAllSubscriptions(::grpc::ServerContext* context, const google::protobuf::Empty*, google::protobuf::Empty*) {
  return Serve([&] { service_->PauseAllSubscriptions(CallerOf(context)); });
}

::grpc::Status AdminServer::ValidateSystemState(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::ValidateSystemStateResponse* resp) {
  return Serve([&] { *resp = service_->ValidateSystemState(CallerOf(context)); });
}

} // namespace registry::grpc
