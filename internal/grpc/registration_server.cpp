#include "registration_server.hpp"

#include "grpc_error.hpp"

namespace registry::grpc {

RegistrationServer::RegistrationServer(std::shared_ptr<registry::service::RegistrationService> svc) : service_(std::move(svc)) {
}

::grpc::Status RegistrationServer::RegisterName(::grpc::ServerContext* context, const registry::v1::RegisterNameRequest* req, registry::v1::RegisterNameResponse* resp) {
  return Serve([&] { *resp = service_->RegisterName(CallerOf(context), *req); });
}

::grpc::Status RegistrationServer::AdminAddName(::grpc::ServerContext* context, const registry::v1::AdminAddNameRequest* req, google::protobuf::Empty*) {
  return Serve([&] { service_->AdminAddName(CallerOf(context), *req); });
}

::grpc::Status RegistrationServer::GetPaymentInfo(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::GetPaymentInfoResponse* resp) {
  return Serve([&] { *resp = service_->GetPaymentInfo(CallerOf(context)); });
}

::grpc::Status RegistrationServer::GetNameRecord(::grpc::ServerContext* context, const registry::v1::NameRequest* req, registry::v1::GetNameRecordResponse* resp) {
  return Serve([&] { *resp = service_->GetNameRecord(CallerOf(context), *req); });
}

::grpc::Status RegistrationServer::ListNameRecords(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::ListNameRecordsResponse* resp) {
  return Serve([&] { *resp = service_->ListNameRecords(CallerOf(context)); });
}

::grpc::Status RegistrationServer::HasRegisteredName(::grpc::ServerContext* context, const registry::v1::OwnerRequest* req, registry::v1::BoolResponse* resp) {
  return Serve([&] { *resp = service_->HasRegisteredName(CallerOf(context), *req); });
}

::grpc::Status RegistrationServer::CheckBlockUsed(::grpc::ServerContext* context, const registry::v1::BlockRequest* req, registry::v1::BoolResponse* resp) {
  return Serve([&] { *resp = service_->CheckBlockUsed(CallerOf(context), *req); });
}

::grpc::Status RegistrationServer::GetPaymentByBlock(::grpc::ServerContext* context, const registry::v1::BlockRequest* req, registry::v1::GetPaymentByBlockResponse* resp) {
  return Serve([&] { *resp = service_->GetPaymentByBlock(CallerOf(context), *req); });
}

::grpc::Status RegistrationServer::GetPaymentHistory(::grpc::ServerContext* context, const google::protobuf::Empty*, registry::v1::PaymentHistoryResponse* resp) {
  return Serve([&] { *resp = service_->GetPaymentHistory(CallerOf(context)); });
}

::grpc::Status RegistrationServer::GetSubscription(::grpc::ServerContext* context, const registry::v1::OwnerRequest* req, registry::v1::GetSubscriptionResponse* resp) {
  return Serve([&] { *resp = service_->GetSubscription(CallerOf(context), *req); });
}

::grpc::Status RegistrationServer::HasActiveSubscription(::grpc::ServerContext* context, const registry::v1::OwnerRequest* req, registry::v1::BoolResponse* resp) {
  return Serve([&] { *resp = service_->HasActiveSubscription(CallerOf(context), *req); });
}

} // namespace registry::grpc
