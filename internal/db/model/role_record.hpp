#pragma once

#include <string>

#include "registry/v1/types.pb.h"

namespace registry::db::model {

struct RoleRecord {
  std::string            principal;
  registry::v1::UserRole role = registry::v1::USER_ROLE_GUEST;
};

struct ProfileRecord {
  std::string principal;
  std::string name;
};

} // namespace registry::db::model
