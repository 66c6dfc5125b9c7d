#include "access_service.hpp"

#include <optional>

#include "internal/access/access_control.hpp"
#include "internal/core/state_store.hpp"
#include "observe_rpc.hpp"

namespace registry::service {

using namespace registry::v1;

namespace {

GetProfileResponse ToResponse(const std::optional<db::model::ProfileRecord>& profile) {
  GetProfileResponse resp;
  if (profile) {
    resp.set_found(true);
    resp.mutable_profile()->set_name(profile->name);
  }
  return resp;
}

} // namespace

AccessService::AccessService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RoleResponse AccessService::InitializeAccessControl(const std::string& caller) {
  return ObserveRpc("AccessService.InitializeAccessControl", caller, [&] {
    RoleResponse resp;
    resp.set_role(ctx_.access->Initialize(caller));
    return resp;
  });
}

RoleResponse AccessService::GetCallerRole(const std::string& caller) {
  return ObserveRpc("AccessService.GetCallerRole", caller, [&] {
    RoleResponse resp;
    resp.set_role(ctx_.access->RoleOf(caller));
    return resp;
  });
}

void AccessService::AssignRole(const std::string& caller, const AssignRoleRequest& req) {
  ObserveRpc("AccessService.AssignRole", caller, [&] { ctx_.access->AssignRole(caller, req.principal(), req.role()); });
}

IsAdminResponse AccessService::IsCallerAdmin(const std::string& caller) {
  return ObserveRpc("AccessService.IsCallerAdmin", caller, [&] {
    IsAdminResponse resp;
    resp.set_is_admin(ctx_.access->IsAdmin(caller));
    return resp;
  });
}

ListAdminsResponse AccessService::ListAdmins(const std::string& caller) {
  return ObserveRpc("AccessService.ListAdmins", caller, [&] {
    ListAdminsResponse resp;
    for (const auto& principal : ctx_.access->ListAdmins()) {
      resp.add_principals(principal);
    }
    resp.set_count(static_cast<uint64_t>(resp.principals_size()));
    return resp;
  });
}

void AccessService::SaveCallerProfile(const std::string& caller, const SaveProfileRequest& req) {
  ObserveRpc("AccessService.SaveCallerProfile", caller, [&] {
    ctx_.store->Write([&](db::Transaction& tx) {
      ctx_.access->Require(tx, caller, USER_ROLE_USER);

      db::model::ProfileRecord record;
      record.principal = caller;
      record.name      = req.profile().name();
      core::ThrowIfDbError(ctx_.store->Repo().UpsertProfile(tx, record), "upsert profile");
    });
  });
}

GetProfileResponse AccessService::GetCallerProfile(const std::string& caller) {
  return ObserveRpc("AccessService.GetCallerProfile", caller, [&] {
    if (access::IsAnonymous(caller)) {
      return GetProfileResponse{};
    }
    return ToResponse(ctx_.store->Read([&](db::Transaction& tx) { return ctx_.store->Repo().GetProfile(tx, caller); }));
  });
}

GetProfileResponse AccessService::GetUserProfile(const std::string& caller, const GetProfileRequest& req) {
  return ObserveRpc("AccessService.GetUserProfile", caller, [&] {
    return ToResponse(ctx_.store->Read([&](db::Transaction& tx) {
      if (caller != req.principal() || access::IsAnonymous(caller)) {
        ctx_.access->Require(tx, caller, USER_ROLE_ADMIN);
      }
      return ctx_.store->Repo().GetProfile(tx, req.principal());
    }));
  });
}

} // namespace registry::service
