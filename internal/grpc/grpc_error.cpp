#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace registry::grpc {

namespace {

::grpc::StatusCode CodeFor(registry::v1::ErrorKind kind) {
  switch (kind) {
    case registry::v1::ERROR_KIND_UNAUTHORIZED:
      return ::grpc::StatusCode::PERMISSION_DENIED;
    case registry::v1::ERROR_KIND_INVALID_RANGE:
    case registry::v1::ERROR_KIND_INVALID_NAME_LENGTH:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case registry::v1::ERROR_KIND_ALREADY_ACTIVE:
    case registry::v1::ERROR_KIND_NOT_DRAFT:
    case registry::v1::ERROR_KIND_NOT_ACTIVE:
    case registry::v1::ERROR_KIND_SEASON_NOT_OPEN:
    case registry::v1::ERROR_KIND_LAST_ADMIN:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case registry::v1::ERROR_KIND_NO_ACTIVE_SEASON:
    case registry::v1::ERROR_KIND_NOT_FOUND:
      return ::grpc::StatusCode::NOT_FOUND;
    case registry::v1::ERROR_KIND_NAME_TAKEN:
    case registry::v1::ERROR_KIND_ALREADY_REGISTERED:
    case registry::v1::ERROR_KIND_REPLAYED_PAYMENT:
      return ::grpc::StatusCode::ALREADY_EXISTS;
    case registry::v1::ERROR_KIND_PAYMENT_NOT_VERIFIED:
      return ::grpc::StatusCode::ABORTED;
    default:
      return ::grpc::StatusCode::INTERNAL;
  }
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* registry_error = dynamic_cast<const registry::util::RegistryError*>(&e)) {
    const auto kind = registry_error->Kind();
    return {CodeFor(kind), e.what(), std::string(registry::util::KindName(kind))};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

std::string CallerOf(const ::grpc::ServerContext* context) {
  if (context == nullptr) {
    return {};
  }
  const auto& metadata = context->client_metadata();
  auto        it       = metadata.find(kCallerMetadataKey);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

} // namespace registry::grpc
