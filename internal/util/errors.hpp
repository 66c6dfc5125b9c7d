#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "registry/v1/types.pb.h"

namespace registry::util {

/*
  Central error types.

  Every precondition failure of the registry is one of these. The gRPC layer
  translates them to status codes and puts the kind name into the status
  details.
*/

class RegistryError : public std::runtime_error {
 public:
  RegistryError(registry::v1::ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  registry::v1::ErrorKind Kind() const {
    return kind_;
  }

 private:
  registry::v1::ErrorKind kind_;
};

class Unauthorized : public RegistryError {
 public:
  explicit Unauthorized(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_UNAUTHORIZED, msg) {
  }
};

class InvalidRange : public RegistryError {
 public:
  explicit InvalidRange(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_INVALID_RANGE, msg) {
  }
};

class AlreadyActive : public RegistryError {
 public:
  explicit AlreadyActive(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_ALREADY_ACTIVE, msg) {
  }
};

class NotDraft : public RegistryError {
 public:
  explicit NotDraft(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_NOT_DRAFT, msg) {
  }
};

class NotActive : public RegistryError {
 public:
  explicit NotActive(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_NOT_ACTIVE, msg) {
  }
};

class NoActiveSeason : public RegistryError {
 public:
  explicit NoActiveSeason(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_NO_ACTIVE_SEASON, msg) {
  }
};

// Wrong status, outside the time window, or no capacity left.
class SeasonNotOpen : public RegistryError {
 public:
  explicit SeasonNotOpen(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_SEASON_NOT_OPEN, msg) {
  }
};

class InvalidNameLength : public RegistryError {
 public:
  explicit InvalidNameLength(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_INVALID_NAME_LENGTH, msg) {
  }
};

class NameTaken : public RegistryError {
 public:
  explicit NameTaken(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_NAME_TAKEN, msg) {
  }
};

class AlreadyRegistered : public RegistryError {
 public:
  explicit AlreadyRegistered(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_ALREADY_REGISTERED, msg) {
  }
};

class ReplayedPayment : public RegistryError {
 public:
  explicit ReplayedPayment(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_REPLAYED_PAYMENT, msg) {
  }
};

class PaymentNotVerified : public RegistryError {
 public:
  explicit PaymentNotVerified(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_PAYMENT_NOT_VERIFIED, msg) {
  }
};

class NotFound : public RegistryError {
 public:
  explicit NotFound(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_NOT_FOUND, msg) {
  }
};

class LastAdmin : public RegistryError {
 public:
  explicit LastAdmin(const std::string& msg) : RegistryError(registry::v1::ERROR_KIND_LAST_ADMIN, msg) {
  }
};

// "ERROR_KIND_NAME_TAKEN" -> "NAME_TAKEN"
std::string_view KindName(registry::v1::ErrorKind kind);

} // namespace registry::util
