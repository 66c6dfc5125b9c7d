#pragma once

#include <string>

#include "registry/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace registry::service {

// Operator queries and controls. Every call requires Admin.
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  registry::v1::StatsResponse        Stats(const std::string& caller);
  registry::v1::ListPaymentsResponse ListPayments(const std::string& caller);

  // Clears is_active on every subscription.
  void PauseAllSubscriptions(const std::string& caller);

  // Scans persisted state for invariant violations. valid is true when no
  // issue was found.
  registry::v1::ValidateSystemStateResponse ValidateSystemState(const std::string& caller);

 private:
  ServiceContext ctx_;
};

} // namespace registry::service
