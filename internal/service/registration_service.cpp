#include "registration_service.hpp"

#include "internal/core/registration_orchestrator.hpp"
#include "internal/core/state_store.hpp"
#include "internal/names/name_ledger.hpp"
#include "internal/payment/payment_verifier.hpp"
#include "observe_rpc.hpp"
#include "record_convert.hpp"

namespace registry::service {

using namespace registry::v1;

namespace {

AddressType OrIdentity(AddressType type) {
  return type == ADDRESS_TYPE_UNSPECIFIED ? ADDRESS_TYPE_IDENTITY : type;
}

} // namespace

RegistrationService::RegistrationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterNameResponse RegistrationService::RegisterName(const std::string& caller, const RegisterNameRequest& req) {
  return ObserveRpc("RegistrationService.RegisterName", caller, [&] {
    core::RegistrationRequest request;
    request.name         = req.name();
    request.address      = req.address();
    request.address_type = OrIdentity(req.address_type());
    request.season_id    = req.season_id();
    request.block_index  = req.block_index();

    RegisterNameResponse resp;
    resp.set_payment_id(ctx_.orchestrator->Register(caller, request));
    return resp;
  });
}

void RegistrationService::AdminAddName(const std::string& caller, const AdminAddNameRequest& req) {
  ObserveRpc("RegistrationService.AdminAddName", caller, [&] {
    core::AdminNameRequest request;
    request.name         = req.name();
    request.address      = req.address();
    request.address_type = OrIdentity(req.address_type());
    request.owner        = req.owner();
    ctx_.orchestrator->AdminAddName(caller, request);
  });
}

GetPaymentInfoResponse RegistrationService::GetPaymentInfo(const std::string& caller) {
  return ObserveRpc("RegistrationService.GetPaymentInfo", caller, [&] {
    const auto& options = ctx_.orchestrator->Options();

    GetPaymentInfoResponse resp;
    resp.set_recipient_account(options.recipient);
    resp.set_server_time(ctx_.now());
    resp.set_subscription_days(static_cast<uint32_t>(options.subscription_days));
    return resp;
  });
}

GetNameRecordResponse RegistrationService::GetNameRecord(const std::string& caller, const NameRequest& req) {
  return ObserveRpc("RegistrationService.GetNameRecord", caller, [&] {
    GetNameRecordResponse resp;
    *resp.mutable_record() = ToProto(ctx_.names->Get(req.name()));
    return resp;
  });
}

ListNameRecordsResponse RegistrationService::ListNameRecords(const std::string& caller) {
  return ObserveRpc("RegistrationService.ListNameRecords", caller, [&] {
    ListNameRecordsResponse resp;
    for (const auto& record : ctx_.names->List()) {
      *resp.add_records() = ToProto(record);
    }
    return resp;
  });
}

BoolResponse RegistrationService::HasRegisteredName(const std::string& caller, const OwnerRequest& req) {
  return ObserveRpc("RegistrationService.HasRegisteredName", caller, [&] {
    BoolResponse resp;
    resp.set_value(ctx_.names->OwnerHasName(req.owner()));
    return resp;
  });
}

BoolResponse RegistrationService::CheckBlockUsed(const std::string& caller, const BlockRequest& req) {
  return ObserveRpc("RegistrationService.CheckBlockUsed", caller, [&] {
    BoolResponse resp;
    resp.set_value(ctx_.payments->IsReferenceUsed(req.block_index()));
    return resp;
  });
}

GetPaymentByBlockResponse RegistrationService::GetPaymentByBlock(const std::string& caller, const BlockRequest& req) {
  return ObserveRpc("RegistrationService.GetPaymentByBlock", caller, [&] {
    GetPaymentByBlockResponse resp;
    if (auto payment = ctx_.payments->GetByBlock(req.block_index())) {
      resp.set_found(true);
      *resp.mutable_payment() = ToProto(*payment);
    }
    return resp;
  });
}

PaymentHistoryResponse RegistrationService::GetPaymentHistory(const std::string& caller) {
  return ObserveRpc("RegistrationService.GetPaymentHistory", caller, [&] {
    PaymentHistoryResponse resp;
    for (const auto& payment : ctx_.payments->History(caller)) {
      *resp.add_payments() = ToProto(payment);
    }
    return resp;
  });
}

GetSubscriptionResponse RegistrationService::GetSubscription(const std::string& caller, const OwnerRequest& req) {
  return ObserveRpc("RegistrationService.GetSubscription", caller, [&] {
    const auto subscription = ctx_.store->Read([&](db::Transaction& tx) { return ctx_.store->Repo().GetSubscription(tx, req.owner()); });

    GetSubscriptionResponse resp;
    if (subscription) {
      resp.set_found(true);
      *resp.mutable_subscription() = ToProto(*subscription);
    }
    return resp;
  });
}

BoolResponse RegistrationService::HasActiveSubscription(const std::string& caller, const OwnerRequest& req) {
  return ObserveRpc("RegistrationService.HasActiveSubscription", caller, [&] {
    const auto subscription = ctx_.store->Read([&](db::Transaction& tx) { return ctx_.store->Repo().GetSubscription(tx, req.owner()); });
    const auto now          = ctx_.now();

    BoolResponse resp;
    resp.set_value(subscription && subscription->is_active && now < subscription->end_time);
    return resp;
  });
}

} // namespace registry::service
