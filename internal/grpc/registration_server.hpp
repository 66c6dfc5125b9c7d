#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/registration_service.hpp"
#include "registry/v1/registration_service.grpc.pb.h"

namespace registry::grpc {

class RegistrationServer final : public registry::v1::RegistrationService::Service {
 public:
  explicit RegistrationServer(std::shared_ptr<registry::service::RegistrationService> svc);

  ::grpc::Status RegisterName(::grpc::ServerContext* context, const registry::v1::RegisterNameRequest* req, registry::v1::RegisterNameResponse* resp) override;
  ::grpc::Status AdminAddName(::grpc::ServerContext* context, const registry::v1::AdminAddNameRequest* req, google::protobuf::Empty* resp) override;
  ::grpc::Status GetPaymentInfo(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::GetPaymentInfoResponse* resp) override;
  ::grpc::Status GetNameRecord(::grpc::ServerContext* context, const registry::v1::NameRequest* req, registry::v1::GetNameRecordResponse* resp) override;
  ::grpc::Status ListNameRecords(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::ListNameRecordsResponse* resp) override;
  ::grpc::Status HasRegisteredName(::grpc::ServerContext* context, const registry::v1::OwnerRequest* req, registry::v1::BoolResponse* resp) override;
  ::grpc::Status CheckBlockUsed(::grpc::ServerContext* context, const registry::v1::BlockRequest* req, registry::v1::BoolResponse* resp) override;
  ::grpc::Status GetPaymentByBlock(::grpc::ServerContext* context, const registry::v1::BlockRequest* req, registry::v1::GetPaymentByBlockResponse* resp) override;
  ::grpc::Status GetPaymentHistory(::grpc::ServerContext* context, const google::protobuf::Empty* req, registry::v1::PaymentHistoryResponse* resp) override;
  ::grpc::Status GetSubscription(::grpc::ServerContext* context, const registry::v1::OwnerRequest* req, registry::v1::GetSubscriptionResponse* resp) override;
  ::grpc::Status HasActiveSubscription(::grpc::ServerContext* context, const registry::v1::OwnerRequest* req, registry::v1::BoolResponse* resp) override;

 private:
  std::shared_ptr<registry::service::RegistrationService> service_;
};

} // namespace registry::grpc
