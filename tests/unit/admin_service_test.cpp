#include <cassert>
#include <iostream>

#include "internal/service/admin_service.hpp"
#include "internal/service/registration_service.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/registry_fixture.hpp"

namespace {

using registry::testing::kAdmin;
using registry::testing::kRecipient;
using registry::testing::kT0;
using registry::testing::RegistryFixture;
using registry::testing::Throws;
using namespace registry::v1;

constexpr uint64_t kPrice = 250;

// Two paid registrations in one season plus an admin grant.
void Populate(RegistryFixture& fx) {
  fx.AddUser("alice");
  fx.AddUser("bob");
  const auto season = fx.OpenSeason(10, 3, 10, kPrice);
  fx.ledger->AddTransfer(1, "alice-wallet", kRecipient, kPrice);
  fx.ledger->AddTransfer(2, "bob-wallet", kRecipient, kPrice);
  fx.orchestrator->Register("alice", fx.Request("alpha", season, 1));
  fx.orchestrator->Register("bob", fx.Request("bravo", season, 2));

  registry::core::AdminNameRequest grant;
  grant.name  = "charlie";
  grant.owner = "carol";
  fx.orchestrator->AdminAddName(kAdmin, grant);

  fx.seasons->Create(kAdmin, {"next", kT0, kT0 + 10, 5, 1, 5, 1});
}

void TestStats() {
  RegistryFixture                fx;
  registry::service::AdminService admin(fx.Context());
  Populate(fx);

  const auto stats = admin.Stats(kAdmin);
  assert(stats.total_seasons() == 2);
  assert(stats.active_seasons() == 1);
  assert(stats.draft_seasons() == 1);
  assert(stats.ended_seasons() == 0);
  assert(stats.total_names() == 3);
  assert(stats.total_payments() == 2);
  assert(stats.total_revenue() == 2 * kPrice);
  assert(stats.total_subscriptions() == 2);
  assert(stats.active_subscriptions() == 2);

  assert(Throws<registry::util::Unauthorized>([&] { admin.Stats("alice"); }));
  assert(Throws<registry::util::Unauthorized>([&] { admin.ListPayments("alice"); }));
  assert(admin.ListPayments(kAdmin).payments_size() == 2);
}

void TestSubscriptionsAndPause() {
  RegistryFixture                       fx;
  registry::service::AdminService        admin(fx.Context());
  registry::service::RegistrationService registration(fx.Context());
  Populate(fx);

  OwnerRequest owner;
  owner.set_owner("alice");
  assert(registration.GetSubscription("anyone", owner).found());
  assert(registration.HasActiveSubscription("anyone", owner).value());

  owner.set_owner("carol");
  assert(!registration.GetSubscription("anyone", owner).found());
  assert(!registration.HasActiveSubscription("anyone", owner).value());

  // expiry
  owner.set_owner("alice");
  fx.clock->store(kT0 + 366 * registry::util::kNanosPerDay);
  assert(!registration.HasActiveSubscription("anyone", owner).value());
  fx.clock->store(kT0);

  assert(Throws<registry::util::Unauthorized>([&] { admin.PauseAllSubscriptions("bob"); }));
  admin.PauseAllSubscriptions(kAdmin);
  assert(!registration.HasActiveSubscription("anyone", owner).value());
  assert(admin.Stats(kAdmin).active_subscriptions() == 0);
}

void TestPaymentQueries() {
  RegistryFixture                       fx;
  registry::service::RegistrationService registration(fx.Context());
  Populate(fx);

  BlockRequest block;
  block.set_block_index(1);
  assert(registration.CheckBlockUsed("anyone", block).value());
  const auto by_block = registration.GetPaymentByBlock("anyone", block);
  assert(by_block.found());
  assert(by_block.payment().payer() == "alice");

  block.set_block_index(3);
  assert(!registration.CheckBlockUsed("anyone", block).value());
  assert(!registration.GetPaymentByBlock("anyone", block).found());

  const auto history = registration.GetPaymentHistory("bob");
  assert(history.payments_size() == 1);
  assert(history.payments(0).registration_name() == "bravo");
  assert(registration.GetPaymentHistory("carol").payments_size() == 0);

  OwnerRequest owner;
  owner.set_owner("carol");
  assert(registration.HasRegisteredName("anyone", owner).value());
  assert(registration.ListNameRecords("anyone").records_size() == 3);
}

void TestValidateReportsNoIssuesAfterNormalUse() {
  RegistryFixture                fx;
  registry::service::AdminService admin(fx.Context());
  Populate(fx);

  const auto report = admin.ValidateSystemState(kAdmin);
  assert(report.valid());
  assert(report.issues_size() == 0);
  assert(Throws<registry::util::Unauthorized>([&] { admin.ValidateSystemState("alice"); }));
}

void TestValidateFindsCorruption() {
  RegistryFixture                fx;
  registry::service::AdminService admin(fx.Context());
  Populate(fx);

  // write around the components to break invariants
  fx.store->Write([&](registry::db::Transaction& tx) {
    auto& repo = fx.store->Repo();

    registry::db::model::PaymentRecord orphan;
    orphan.payer       = "mallory";
    orphan.amount      = 1;
    orphan.block_index = 99;
    const auto payment_result = repo.InsertPayment(tx, orphan);
    assert(payment_result);

    registry::db::model::NameRecord stray;
    stray.name      = "stray";
    stray.owner     = "mallory";
    stray.season_id = 404;
    const auto name_result = repo.InsertName(tx, stray);
    assert(name_result);

    registry::db::model::SubscriptionRecord dangling;
    dangling.user       = "mallory";
    dangling.payment_id = 12345;
    const auto subscription_result = repo.InsertSubscription(tx, dangling);
    assert(subscription_result);
  });

  const auto report = admin.ValidateSystemState(kAdmin);
  assert(!report.valid());
  assert(report.issues_size() == 3);
}

} // namespace

int main() {
  TestStats();
  TestSubscriptionsAndPause();
  TestPaymentQueries();
  TestValidateReportsNoIssuesAfterNormalUse();
  TestValidateFindsCorruption();

  std::cout << "name_registry_unit_admin_service: pass\n";
  return 0;
}
