#include "registration_orchestrator.hpp"

#include <exception>
#include <limits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/utf8.hpp"

namespace registry::core {

using db::model::SeasonRecord;

void RequireNameLength(const std::string& name, uint64_t min_length, uint64_t max_length) {
  const auto code_points = util::CodePointLength(name);
  if (!code_points) {
    throw util::InvalidNameLength("name is not valid UTF-8");
  }
  const auto length = *code_points;
  if (length < min_length || length > max_length) {
    throw util::InvalidNameLength("name length " + std::to_string(length) + " outside [" + std::to_string(min_length) + ", " +
                                  std::to_string(max_length) + "]");
  }
}

RegistrationOrchestrator::RegistrationOrchestrator(std::shared_ptr<StateStore> store, std::shared_ptr<access::AccessControl> access,
                                                   std::shared_ptr<season::SeasonRegistry> seasons, std::shared_ptr<names::NameLedger> names,
                                                   std::shared_ptr<payment::PaymentVerifier> payments, RegistrationOptions options,
                                                   util::NowFn now)
    : store_(std::move(store)),
      access_(std::move(access)),
      seasons_(std::move(seasons)),
      names_(std::move(names)),
      payments_(std::move(payments)),
      options_(std::move(options)),
      now_(std::move(now)) {
}

SeasonRecord RegistrationOrchestrator::CheckEligible(db::Transaction& tx, const std::string& caller, const RegistrationRequest& request,
                                                     uint64_t now) {
  if (names_->OwnerHasName(tx, caller)) {
    throw util::AlreadyRegistered("caller " + caller + " already holds a name");
  }
  if (payments_->IsReferenceUsed(tx, request.block_index)) {
    throw util::ReplayedPayment("block " + std::to_string(request.block_index) + " already paid for a registration");
  }

  auto season = seasons_->Find(tx, request.season_id);
  if (!season) {
    throw util::SeasonNotOpen("season " + std::to_string(request.season_id) + " does not exist");
  }
  seasons_->RequireOpen(tx, *season, now);

  RequireNameLength(request.name, season->min_name_length, season->max_name_length);

  if (names_->IsNameTaken(tx, request.name)) {
    throw util::NameTaken("name " + request.name + " is taken");
  }
  return *season;
}

uint64_t RegistrationOrchestrator::Register(const std::string& caller, const RegistrationRequest& request) {
  observability::SpanScope span("registration.Register");
  span.SetAttribute("name", request.name);
  span.SetAttribute("block_index", static_cast<std::int64_t>(request.block_index));

  try {
    const auto season = store_->Read([&](db::Transaction& tx) {
      access_->Require(tx, caller, registry::v1::USER_ROLE_USER);
      return CheckEligible(tx, caller, request, now_());
    });

    if (!payments_->Verify(request.block_index, season.price, options_.recipient)) {
      throw util::PaymentNotVerified("block " + std::to_string(request.block_index) + " is not a qualifying payment");
    }

    const auto payment_id = store_->Write([&](db::Transaction& tx) {
      const auto now     = now_();
      const auto current = CheckEligible(tx, caller, request, now);

      if (!payments_->Consume(tx, request.block_index, now)) {
        throw util::ReplayedPayment("block " + std::to_string(request.block_index) + " already paid for a registration");
      }

      db::model::PaymentRecord payment;
      payment.payer             = caller;
      payment.amount            = current.price;
      payment.block_index       = request.block_index;
      payment.verified_at       = now;
      payment.registration_name = request.name;
      ThrowIfDbError(store_->Repo().InsertPayment(tx, payment), "insert payment");

      db::model::NameRecord record;
      record.name         = request.name;
      record.address      = request.address;
      record.address_type = request.address_type;
      record.owner        = caller;
      record.season_id    = current.id;
      record.created_at   = now;
      record.updated_at   = now;
      names_->Commit(tx, record);

      db::model::SubscriptionRecord subscription;
      subscription.user            = caller;
      subscription.registered_name = request.name;
      subscription.start_time      = now;
      subscription.end_time        = now + options_.subscription_days * util::kNanosPerDay;
      subscription.payment_id      = payment.id;
      subscription.is_active       = true;
      ThrowIfDbError(store_->Repo().InsertSubscription(tx, subscription), "insert subscription");

      return payment.id;
    });

    observability::Metrics::Instance().RecordRegistration("ok");
    REGISTRY_LOG_INFO("name registered", {observability::StringField("name", request.name), observability::StringField("owner", caller),
                                          observability::UintField("season_id", request.season_id),
                                          observability::UintField("block_index", request.block_index),
                                          observability::UintField("payment_id", payment_id)});
    return payment_id;
  } catch (const util::RegistryError& e) {
    observability::Metrics::Instance().RecordRegistration(util::KindName(e.Kind()));
    throw;
  } catch (const std::exception&) {
    observability::Metrics::Instance().RecordRegistration("INTERNAL");
    throw;
  }
}

void RegistrationOrchestrator::AdminAddName(const std::string& caller, const AdminNameRequest& request) {
  if (access::IsAnonymous(request.owner)) {
    throw util::Unauthorized("anonymous identity cannot own a name");
  }

  const auto season_id = store_->Write([&](db::Transaction& tx) {
    access_->Require(tx, caller, registry::v1::USER_ROLE_ADMIN);

    const auto active = seasons_->FindActive(tx);
    if (active) {
      RequireNameLength(request.name, active->min_name_length, active->max_name_length);
      if (names_->CountForSeason(tx, active->id) >= active->max_names) {
        throw util::SeasonNotOpen("season " + std::to_string(active->id) + " has no names left");
      }
    } else {
      RequireNameLength(request.name, 0, std::numeric_limits<uint64_t>::max());
    }
    if (names_->IsNameTaken(tx, request.name)) {
      throw util::NameTaken("name " + request.name + " is taken");
    }
    if (names_->OwnerHasName(tx, request.owner)) {
      throw util::AlreadyRegistered("owner " + request.owner + " already holds a name");
    }

    const auto            now = now_();
    db::model::NameRecord record;
    record.name         = request.name;
    record.address      = request.address;
    record.address_type = request.address_type;
    record.owner        = request.owner;
    record.season_id    = active ? active->id : 0;
    record.created_at   = now;
    record.updated_at   = now;
    names_->Commit(tx, record);
    return record.season_id;
  });

  REGISTRY_LOG_INFO("name added by admin", {observability::StringField("name", request.name), observability::StringField("owner", request.owner),
                                            observability::StringField("admin", caller), observability::UintField("season_id", season_id)});
}

} // namespace registry::core
