#pragma once

#include <exception>
#include <string>

#include <grpcpp/grpcpp.h>

namespace registry::grpc {

// Request metadata key carrying the caller identity.
inline constexpr const char* kCallerMetadataKey = "x-registry-caller";

/*
  Converts internal exceptions into gRPC status codes.

  Registry errors carry their kind name (e.g. "NAME_TAKEN") in the status
  details. Anything else is INTERNAL.
*/
::grpc::Status ToStatus(const std::exception& e);

// Caller identity from request metadata; empty when absent.
std::string CallerOf(const ::grpc::ServerContext* context);

// Runs fn and maps any exception it throws through ToStatus.
template <typename Fn>
::grpc::Status Serve(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace registry::grpc
