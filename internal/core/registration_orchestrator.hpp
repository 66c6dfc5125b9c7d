#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/access/access_control.hpp"
#include "internal/core/state_store.hpp"
#include "internal/names/name_ledger.hpp"
#include "internal/payment/payment_verifier.hpp"
#include "internal/season/season_registry.hpp"
#include "internal/util/time.hpp"
#include "registry/v1/types.pb.h"

namespace registry::core {

struct RegistrationRequest {
  std::string               name;
  std::string               address;
  registry::v1::AddressType address_type = registry::v1::ADDRESS_TYPE_IDENTITY;
  uint64_t                  season_id    = 0;
  uint64_t                  block_index  = 0;
};

struct AdminNameRequest {
  std::string               name;
  std::string               address;
  registry::v1::AddressType address_type = registry::v1::ADDRESS_TYPE_IDENTITY;
  std::string               owner;
};

struct RegistrationOptions {
  // ledger account that must receive registration payments
  std::string recipient;
  uint64_t    subscription_days = 365;
};

/*
  RegistrationOrchestrator

  Paid registration runs in three phases:

    1. read section: role, owner, block, season, length and name checks
    2. ledger verification with no section held
    3. write section: the phase 1 checks again, then consume the block and
       write payment, name and subscription together

  A failed check in phase 3 raises the same error as in phase 1 and writes
  nothing, so two callers racing on one block end with exactly one
  registration.
*/
class RegistrationOrchestrator {
 public:
  RegistrationOrchestrator(std::shared_ptr<StateStore> store, std::shared_ptr<access::AccessControl> access,
                           std::shared_ptr<season::SeasonRegistry> seasons, std::shared_ptr<names::NameLedger> names,
                           std::shared_ptr<payment::PaymentVerifier> payments, RegistrationOptions options,
                           util::NowFn now = util::SystemClock());

  // Returns the id of the new verified payment.
  uint64_t Register(const std::string& caller, const RegistrationRequest& request);

  // Admin path without payment. Same name and owner rules; length bounds of
  // the active season apply when one exists.
  void AdminAddName(const std::string& caller, const AdminNameRequest& request);

  const RegistrationOptions& Options() const {
    return options_;
  }

 private:
  // Checks 2-6 of a paid registration; returns the season they were run against.
  db::model::SeasonRecord CheckEligible(db::Transaction& tx, const std::string& caller, const RegistrationRequest& request, uint64_t now);

  std::shared_ptr<StateStore>               store_;
  std::shared_ptr<access::AccessControl>    access_;
  std::shared_ptr<season::SeasonRegistry>   seasons_;
  std::shared_ptr<names::NameLedger>        names_;
  std::shared_ptr<payment::PaymentVerifier> payments_;
  RegistrationOptions                       options_;
  util::NowFn                               now_;
};

// Throws InvalidNameLength unless min <= code points of name <= max.
void RequireNameLength(const std::string& name, uint64_t min_length, uint64_t max_length);

} // namespace registry::core
