#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/registration_server.hpp"
#include "internal/grpc/season_server.hpp"
#include "internal/service/registration_service.hpp"
#include "internal/service/season_service.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/registry_fixture.hpp"

namespace {

using registry::grpc::ToStatus;
using registry::testing::RegistryFixture;
using registry::testing::kRecipient;
using registry::testing::kT0;

void ExpectStatus(const std::exception& e, ::grpc::StatusCode code, const std::string& details) {
  const auto status = ToStatus(e);
  assert(status.error_code() == code);
  assert(status.error_details() == details);
  assert(status.error_message() == e.what());
}

void TestErrorKindsMapToStatusCodes() {
  using namespace registry::util;
  ExpectStatus(Unauthorized("x"), ::grpc::StatusCode::PERMISSION_DENIED, "UNAUTHORIZED");
  ExpectStatus(InvalidRange("x"), ::grpc::StatusCode::INVALID_ARGUMENT, "INVALID_RANGE");
  ExpectStatus(InvalidNameLength("x"), ::grpc::StatusCode::INVALID_ARGUMENT, "INVALID_NAME_LENGTH");
  ExpectStatus(AlreadyActive("x"), ::grpc::StatusCode::FAILED_PRECONDITION, "ALREADY_ACTIVE");
  ExpectStatus(NotDraft("x"), ::grpc::StatusCode::FAILED_PRECONDITION, "NOT_DRAFT");
  ExpectStatus(NotActive("x"), ::grpc::StatusCode::FAILED_PRECONDITION, "NOT_ACTIVE");
  ExpectStatus(SeasonNotOpen("x"), ::grpc::StatusCode::FAILED_PRECONDITION, "SEASON_NOT_OPEN");
  ExpectStatus(LastAdmin("x"), ::grpc::StatusCode::FAILED_PRECONDITION, "LAST_ADMIN");
  ExpectStatus(NoActiveSeason("x"), ::grpc::StatusCode::NOT_FOUND, "NO_ACTIVE_SEASON");
  ExpectStatus(NotFound("x"), ::grpc::StatusCode::NOT_FOUND, "NOT_FOUND");
  ExpectStatus(NameTaken("x"), ::grpc::StatusCode::ALREADY_EXISTS, "NAME_TAKEN");
  ExpectStatus(AlreadyRegistered("x"), ::grpc::StatusCode::ALREADY_EXISTS, "ALREADY_REGISTERED");
  ExpectStatus(ReplayedPayment("x"), ::grpc::StatusCode::ALREADY_EXISTS, "REPLAYED_PAYMENT");
  ExpectStatus(PaymentNotVerified("x"), ::grpc::StatusCode::ABORTED, "PAYMENT_NOT_VERIFIED");
  ExpectStatus(std::runtime_error("disk on fire"), ::grpc::StatusCode::INTERNAL, "");
}

void TestAnonymousCreateSeasonIsPermissionDenied() {
  RegistryFixture          fx;
  auto                     service = std::make_shared<registry::service::SeasonService>(fx.Context());
  registry::grpc::SeasonServer server(service);

  registry::v1::CreateSeasonRequest req;
  req.set_name("spring");
  req.set_start_time(1);
  req.set_end_time(2);
  req.set_max_names(1);
  req.set_price(1);
  registry::v1::CreateSeasonResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  const auto status = server.CreateSeason(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(status.error_details() == "UNAUTHORIZED");
}

void TestMissingSeasonIsNotFound() {
  RegistryFixture          fx;
  auto                     service = std::make_shared<registry::service::SeasonService>(fx.Context());
  registry::grpc::SeasonServer server(service);

  registry::v1::SeasonIdRequest   req;
  registry::v1::GetSeasonResponse resp;
  ::grpc::ServerContext           grpc_ctx;
  req.set_id(12);
  assert(server.GetSeason(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  google::protobuf::Empty empty;
  assert(server.GetActiveSeason(&grpc_ctx, &empty, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestOpenQueriesSucceedForAnonymousCallers() {
  RegistryFixture fx;
  fx.OpenSeason();
  auto                               service = std::make_shared<registry::service::RegistrationService>(fx.Context());
  registry::grpc::RegistrationServer server(service);

  registry::v1::BlockRequest req;
  req.set_block_index(5);
  registry::v1::BoolResponse resp;
  ::grpc::ServerContext      grpc_ctx;

  assert(server.CheckBlockUsed(&grpc_ctx, &req, &resp).ok());
  assert(!resp.value());

  registry::v1::RegisterNameRequest register_req;
  register_req.set_name("abc");
  register_req.set_season_id(1);
  register_req.set_block_index(5);
  registry::v1::RegisterNameResponse register_resp;
  assert(server.RegisterName(&grpc_ctx, &register_req, &register_resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
}

void TestPaymentInfoForAnonymousCallers() {
  RegistryFixture fx;
  fx.clock->store(kT0 + 42);
  auto                               service = std::make_shared<registry::service::RegistrationService>(fx.Context());
  registry::grpc::RegistrationServer server(service);

  google::protobuf::Empty                empty;
  registry::v1::GetPaymentInfoResponse   resp;
  ::grpc::ServerContext                  grpc_ctx;
  assert(server.GetPaymentInfo(&grpc_ctx, &empty, &resp).ok());
  assert(resp.recipient_account() == kRecipient);
  assert(resp.server_time() == kT0 + 42);
  assert(resp.subscription_days() == 365);
}

} // namespace

int main() {
  TestErrorKindsMapToStatusCodes();
  TestAnonymousCreateSeasonIsPermissionDenied();
  TestMissingSeasonIsNotFound();
  TestOpenQueriesSucceedForAnonymousCallers();
  TestPaymentInfoForAnonymousCallers();

  std::cout << "name_registry_unit_grpc_status: pass\n";
  return 0;
}
