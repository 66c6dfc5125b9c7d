#pragma once

#include <string>

#include "registry/v1/access_service.pb.h"
#include "service_context.hpp"

namespace registry::service {

class AccessService {
 public:
  explicit AccessService(ServiceContext ctx);

  registry::v1::RoleResponse InitializeAccessControl(const std::string& caller);
  registry::v1::RoleResponse GetCallerRole(const std::string& caller);

  void AssignRole(const std::string& caller, const registry::v1::AssignRoleRequest& req);

  registry::v1::IsAdminResponse    IsCallerAdmin(const std::string& caller);
  registry::v1::ListAdminsResponse ListAdmins(const std::string& caller);

  // Requires User.
  void SaveCallerProfile(const std::string& caller, const registry::v1::SaveProfileRequest& req);

  registry::v1::GetProfileResponse GetCallerProfile(const std::string& caller);

  // Self or Admin.
  registry::v1::GetProfileResponse GetUserProfile(const std::string& caller, const registry::v1::GetProfileRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace registry::service
