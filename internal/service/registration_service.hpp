#pragma once

#include <string>

#include "registry/v1/registration_service.pb.h"
#include "service_context.hpp"

namespace registry::service {

/*
  Name registration plus the payment and subscription queries that hang off
  a registration.
*/
class RegistrationService {
 public:
  explicit RegistrationService(ServiceContext ctx);

  registry::v1::RegisterNameResponse RegisterName(const std::string& caller, const registry::v1::RegisterNameRequest& req);

  void AdminAddName(const std::string& caller, const registry::v1::AdminAddNameRequest& req);

  // Open query: payment recipient and the server clock.
  registry::v1::GetPaymentInfoResponse GetPaymentInfo(const std::string& caller);

  registry::v1::GetNameRecordResponse   GetNameRecord(const std::string& caller, const registry::v1::NameRequest& req);
  registry::v1::ListNameRecordsResponse ListNameRecords(const std::string& caller);
  registry::v1::BoolResponse            HasRegisteredName(const std::string& caller, const registry::v1::OwnerRequest& req);

  registry::v1::BoolResponse              CheckBlockUsed(const std::string& caller, const registry::v1::BlockRequest& req);
  registry::v1::GetPaymentByBlockResponse GetPaymentByBlock(const std::string& caller, const registry::v1::BlockRequest& req);

  // Payments made by the caller.
  registry::v1::PaymentHistoryResponse GetPaymentHistory(const std::string& caller);

  registry::v1::GetSubscriptionResponse GetSubscription(const std::string& caller, const registry::v1::OwnerRequest& req);
  registry::v1::BoolResponse            HasActiveSubscription(const std::string& caller, const registry::v1::OwnerRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace registry::service
