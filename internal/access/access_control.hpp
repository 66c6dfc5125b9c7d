#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/state_store.hpp"
#include "registry/v1/types.pb.h"

namespace registry::access {

// Callers presenting no identity. They are always Guest.
constexpr std::string_view kAnonymous = "anonymous";

bool IsAnonymous(std::string_view caller);

// Admin > User > Guest. Unspecified ranks as Guest.
int Rank(registry::v1::UserRole role);

/*
  AccessControl

  Maps caller identities to roles. Role changes are written immediately and
  are never rolled back by a later failure of the calling operation.
*/
class AccessControl {
 public:
  explicit AccessControl(std::shared_ptr<core::StateStore> store);

  registry::v1::UserRole RoleOf(const std::string& caller);
  registry::v1::UserRole RoleOf(db::Transaction& tx, const std::string& caller);

  bool HasPermission(const std::string& caller, registry::v1::UserRole required);

  // Throws Unauthorized unless caller's role is at least required.
  void Require(db::Transaction& tx, const std::string& caller, registry::v1::UserRole required);

  // Admin only. Anonymous targets cannot be raised above Guest and the last
  // Admin cannot be demoted.
  void AssignRole(const std::string& caller, const std::string& target, registry::v1::UserRole role);

  // First identified caller becomes Admin when none exists; later unknown
  // callers become User. Returns the caller's role afterwards.
  registry::v1::UserRole Initialize(const std::string& caller);

  // Makes principal Admin if the registry has no Admin yet. Used for the
  // configured bootstrap admin at startup. Returns true if assigned.
  bool SeedAdmin(const std::string& principal);

  bool                     IsAdmin(const std::string& caller);
  uint64_t                 AdminCount();
  std::vector<std::string> ListAdmins();

 private:
  std::vector<std::string> Admins(db::Transaction& tx) const;

  std::shared_ptr<core::StateStore> store_;
};

} // namespace registry::access
