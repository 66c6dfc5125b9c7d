#include "access_control.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace registry::access {

using registry::v1::UserRole;

bool IsAnonymous(std::string_view caller) {
  return caller.empty() || caller == kAnonymous;
}

int Rank(UserRole role) {
  switch (role) {
    case registry::v1::USER_ROLE_ADMIN:
      return 2;
    case registry::v1::USER_ROLE_USER:
      return 1;
    case registry::v1::USER_ROLE_GUEST:
    case registry::v1::USER_ROLE_UNSPECIFIED:
    default:
      return 0;
  }
}

AccessControl::AccessControl(std::shared_ptr<core::StateStore> store) : store_(std::move(store)) {
}

UserRole AccessControl::RoleOf(const std::string& caller) {
  return store_->Read([&](db::Transaction& tx) { return RoleOf(tx, caller); });
}

UserRole AccessControl::RoleOf(db::Transaction& tx, const std::string& caller) {
  if (IsAnonymous(caller)) return registry::v1::USER_ROLE_GUEST;
  auto record = store_->Repo().GetRole(tx, caller);
  return record ? record->role : registry::v1::USER_ROLE_GUEST;
}

bool AccessControl::HasPermission(const std::string& caller, UserRole required) {
  return Rank(RoleOf(caller)) >= Rank(required);
}

void AccessControl::Require(db::Transaction& tx, const std::string& caller, UserRole required) {
  if (Rank(RoleOf(tx, caller)) < Rank(required)) {
    throw util::Unauthorized("caller " + (caller.empty() ? std::string(kAnonymous) : caller) + " lacks role " +
                             registry::v1::UserRole_Name(required));
  }
}

std::vector<std::string> AccessControl::Admins(db::Transaction& tx) const {
  std::vector<std::string> admins;
  for (const auto& record : store_->Repo().ListRoles(tx)) {
    if (record.role == registry::v1::USER_ROLE_ADMIN) admins.push_back(record.principal);
  }
  return admins;
}

void AccessControl::AssignRole(const std::string& caller, const std::string& target, UserRole role) {
  if (role == registry::v1::USER_ROLE_UNSPECIFIED || !registry::v1::UserRole_IsValid(role)) {
    throw util::InvalidRange("role must be GUEST, USER or ADMIN");
  }

  store_->Write([&](db::Transaction& tx) {
    Require(tx, caller, registry::v1::USER_ROLE_ADMIN);

    if (IsAnonymous(target) && Rank(role) > Rank(registry::v1::USER_ROLE_GUEST)) {
      throw util::Unauthorized("anonymous identity cannot be granted " + registry::v1::UserRole_Name(role));
    }

    const auto current = RoleOf(tx, target);
    if (current == registry::v1::USER_ROLE_ADMIN && role != registry::v1::USER_ROLE_ADMIN && Admins(tx).size() <= 1) {
      throw util::LastAdmin("cannot demote the last admin " + target);
    }

    core::ThrowIfDbError(store_->Repo().UpsertRole(tx, {target, role}), "upsert role");
  });

  REGISTRY_LOG_INFO("role assigned", {observability::StringField("caller", caller), observability::StringField("target", target),
                                      observability::StringField("role", registry::v1::UserRole_Name(role))});
}

UserRole AccessControl::Initialize(const std::string& caller) {
  if (IsAnonymous(caller)) {
    throw util::Unauthorized("anonymous callers cannot initialize access control");
  }

  return store_->Write([&](db::Transaction& tx) {
    if (auto existing = store_->Repo().GetRole(tx, caller)) {
      return existing->role;
    }

    const auto role = Admins(tx).empty() ? registry::v1::USER_ROLE_ADMIN : registry::v1::USER_ROLE_USER;
    core::ThrowIfDbError(store_->Repo().UpsertRole(tx, {caller, role}), "upsert role");
    REGISTRY_LOG_INFO("access initialized",
                      {observability::StringField("caller", caller), observability::StringField("role", registry::v1::UserRole_Name(role))});
    return role;
  });
}

bool AccessControl::SeedAdmin(const std::string& principal) {
  if (IsAnonymous(principal)) {
    throw util::Unauthorized("bootstrap admin must be an identified principal");
  }

  return store_->Write([&](db::Transaction& tx) {
    if (!Admins(tx).empty()) return false;
    core::ThrowIfDbError(store_->Repo().UpsertRole(tx, {principal, registry::v1::USER_ROLE_ADMIN}), "upsert role");
    return true;
  });
}

bool AccessControl::IsAdmin(const std::string& caller) {
  return RoleOf(caller) == registry::v1::USER_ROLE_ADMIN;
}

uint64_t AccessControl::AdminCount() {
  return store_->Read([&](db::Transaction& tx) { return static_cast<uint64_t>(Admins(tx).size()); });
}

std::vector<std::string> AccessControl::ListAdmins() {
  return store_->Read([&](db::Transaction& tx) { return Admins(tx); });
}

} // namespace registry::access
