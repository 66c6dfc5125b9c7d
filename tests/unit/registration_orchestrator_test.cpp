#include <cassert>
#include <initializer_list>
#include <iostream>

#include "internal/util/errors.hpp"
#include "tests/support/registry_fixture.hpp"

namespace {

using registry::testing::kAdmin;
using registry::testing::kRecipient;
using registry::testing::RegistryFixture;
using registry::testing::Throws;

constexpr uint64_t kPrice = 100;

uint64_t NameCount(RegistryFixture& fx) {
  return fx.names->List().size();
}

void TestPaidRegistrationWritesPaymentNameAndSubscription() {
  RegistryFixture fx;
  fx.AddUser("alice");
  const auto season = fx.OpenSeason(10, 3, 10, kPrice);
  fx.ledger->AddTransfer(7, "alice-wallet", kRecipient, kPrice);

  const auto payment_id = fx.orchestrator->Register("alice", fx.Request("abc", season, 7));
  assert(payment_id > 0);

  const auto record = fx.names->Get("abc");
  assert(record.owner == "alice");
  assert(record.season_id == season);
  assert(record.created_at == registry::testing::kT0);

  const auto payment = fx.payments->GetByBlock(7);
  assert(payment.has_value());
  assert(payment->id == payment_id);
  assert(payment->payer == "alice");
  assert(payment->amount == kPrice);
  assert(payment->registration_name == "abc");
  assert(fx.payments->IsReferenceUsed(7));

  const auto subscription = fx.store->Read([&](registry::db::Transaction& tx) { return fx.store->Repo().GetSubscription(tx, "alice"); });
  assert(subscription.has_value());
  assert(subscription->payment_id == payment_id);
  assert(subscription->end_time == registry::testing::kT0 + 365 * registry::util::kNanosPerDay);
  assert(subscription->is_active);
}

// create, activate, register, then replay the same block from another user
void TestScenarioReplayedBlock() {
  RegistryFixture fx;
  fx.AddUser("alice");
  fx.AddUser("bob");
  const auto season = fx.OpenSeason(1, 3, 10, kPrice);
  fx.ledger->AddTransfer(1, "alice-wallet", kRecipient, kPrice);

  assert(fx.orchestrator->Register("alice", fx.Request("abc", season, 1)) > 0);
  assert(Throws<registry::util::ReplayedPayment>([&] { fx.orchestrator->Register("bob", fx.Request("xyz", season, 1)); }));
  assert(NameCount(fx) == 1);
}

void TestScenarioNameTooShort() {
  RegistryFixture fx;
  fx.AddUser("alice");
  const auto season = fx.OpenSeason(10, 3, 10, kPrice);
  fx.ledger->AddTransfer(2, "alice-wallet", kRecipient, kPrice);

  assert(Throws<registry::util::InvalidNameLength>([&] { fx.orchestrator->Register("alice", fx.Request("ab", season, 2)); }));
  assert(NameCount(fx) == 0);
  assert(!fx.payments->IsReferenceUsed(2));
  assert(fx.ledger->Queries() == 0);
}

void TestNameLengthCountsCodePoints() {
  RegistryFixture fx;
  fx.AddUser("alice");
  const auto season = fx.OpenSeason(10, 3, 3, kPrice);
  fx.ledger->AddTransfer(3, "alice-wallet", kRecipient, kPrice);

  // three code points, nine bytes
  assert(fx.orchestrator->Register("alice", fx.Request("\xe5\x90\x8d\xe5\x89\x8d\xe5\x80\xa4", season, 3)) > 0);
}

void TestMalformedUtf8IsInvalidLength() {
  RegistryFixture fx;
  fx.AddUser("alice");
  const auto season = fx.OpenSeason(10, 1, 10, kPrice);
  fx.ledger->AddTransfer(3, "alice-wallet", kRecipient, kPrice);

  // truncated lead, stray byte, overlong '/', surrogate half
  for (const char* name : {"abc\xc3", "ab\xff", "ab\xc0\xaf", "ab\xed\xa0\x80"}) {
    assert(Throws<registry::util::InvalidNameLength>([&] { fx.orchestrator->Register("alice", fx.Request(name, season, 3)); }));
  }
  assert(NameCount(fx) == 0);
  assert(!fx.payments->IsReferenceUsed(3));
  assert(fx.ledger->Queries() == 0);

  // four-byte sequence counts once
  assert(fx.orchestrator->Register("alice", fx.Request("\xf0\x9f\x98\x80", season, 3)) > 0);
}

// an owner with a name tries again in a later season with a fresh block
void TestScenarioOwnerAlreadyRegistered() {
  RegistryFixture fx;
  fx.AddUser("alice");
  const auto first = fx.OpenSeason(10, 3, 10, kPrice);
  fx.ledger->AddTransfer(4, "alice-wallet", kRecipient, kPrice);
  fx.ledger->AddTransfer(5, "alice-wallet", kRecipient, kPrice);
  fx.orchestrator->Register("alice", fx.Request("first", first, 4));

  fx.seasons->End(kAdmin, first);
  const auto second = fx.OpenSeason(10, 3, 10, kPrice);

  assert(Throws<registry::util::AlreadyRegistered>([&] { fx.orchestrator->Register("alice", fx.Request("second", second, 5)); }));
  assert(!fx.payments->IsReferenceUsed(5));
  assert(NameCount(fx) == 1);
}

// a full season reports zero slots and rejects without asking the ledger
void TestScenarioSeasonAtCapacity() {
  RegistryFixture fx;
  fx.AddUser("alice");
  fx.AddUser("bob");
  const auto season = fx.OpenSeason(1, 3, 10, kPrice);
  fx.ledger->AddTransfer(1, "alice-wallet", kRecipient, kPrice);
  fx.ledger->AddTransfer(2, "bob-wallet", kRecipient, kPrice);
  fx.orchestrator->Register("alice", fx.Request("abc", season, 1));

  assert(fx.seasons->ActiveInfo().available_names == 0);

  const auto queries = fx.ledger->Queries();
  assert(Throws<registry::util::SeasonNotOpen>([&] { fx.orchestrator->Register("bob", fx.Request("xyz", season, 2)); }));
  assert(fx.ledger->Queries() == queries);
}

void TestGuestCannotRegister() {
  RegistryFixture fx;
  const auto season = fx.OpenSeason(10, 3, 10, kPrice);
  fx.ledger->AddTransfer(1, "wallet", kRecipient, kPrice);

  assert(Throws<registry::util::Unauthorized>([&] { fx.orchestrator->Register("stranger", fx.Request("abc", season, 1)); }));
  assert(Throws<registry::util::Unauthorized>([&] { fx.orchestrator->Register("", fx.Request("abc", season, 1)); }));
  assert(fx.ledger->Queries() == 0);
}

void TestNameTakenAcrossSeasons() {
  RegistryFixture fx;
  fx.AddUser("alice");
  fx.AddUser("bob");
  const auto first = fx.OpenSeason(10, 3, 10, kPrice);
  fx.ledger->AddTransfer(1, "alice-wallet", kRecipient, kPrice);
  fx.ledger->AddTransfer(2, "bob-wallet", kRecipient, kPrice);
  fx.orchestrator->Register("alice", fx.Request("shared", first, 1));

  fx.seasons->End(kAdmin, first);
  const auto second = fx.OpenSeason(10, 3, 10, kPrice);
  assert(Throws<registry::util::NameTaken>([&] { fx.orchestrator->Register("bob", fx.Request("shared", second, 2)); }));
}

void TestSeasonMustBeOpen() {
  RegistryFixture fx;
  fx.AddUser("alice");
  fx.ledger->AddTransfer(1, "alice-wallet", kRecipient, kPrice);

  // unknown season
  assert(Throws<registry::util::SeasonNotOpen>([&] { fx.orchestrator->Register("alice", fx.Request("abc", 99, 1)); }));

  // draft season
  registry::season::SeasonParams params;
  params.start_time      = registry::testing::kT0 - 1;
  params.end_time        = registry::testing::kT0 + registry::util::kNanosPerDay;
  params.max_names       = 5;
  params.min_name_length = 1;
  params.max_name_length = 10;
  params.price           = kPrice;
  const auto draft       = fx.seasons->Create(kAdmin, params);
  assert(Throws<registry::util::SeasonNotOpen>([&] { fx.orchestrator->Register("alice", fx.Request("abc", draft, 1)); }));

  // active but the window has closed
  fx.seasons->Activate(kAdmin, draft);
  fx.clock->store(registry::testing::kT0 + 2 * registry::util::kNanosPerDay);
  assert(Throws<registry::util::SeasonNotOpen>([&] { fx.orchestrator->Register("alice", fx.Request("abc", draft, 1)); }));
  assert(fx.ledger->Queries() == 0);
}

void TestUnverifiedPaymentsChangeNothing() {
  RegistryFixture fx;
  fx.AddUser("alice");
  const auto season = fx.OpenSeason(10, 3, 10, kPrice);

  fx.ledger->AddMint(1, kRecipient, kPrice);
  fx.ledger->AddTransfer(2, "alice-wallet", "someone-else", kPrice);
  fx.ledger->AddTransfer(3, "alice-wallet", kRecipient, kPrice - 1);

  for (uint64_t block : {1, 2, 3, 4}) {
    assert(Throws<registry::util::PaymentNotVerified>([&] { fx.orchestrator->Register("alice", fx.Request("abc", season, block)); }));
    assert(!fx.payments->IsReferenceUsed(block));
  }
  assert(NameCount(fx) == 0);
  assert(fx.payments->All().empty());

  // a retry with a good block succeeds
  fx.ledger->AddTransfer(5, "any-sender", kRecipient, kPrice + 1);
  assert(fx.orchestrator->Register("alice", fx.Request("abc", season, 5)) > 0);
}

void TestLedgerFailureIsNotVerified() {
  RegistryFixture fx;
  fx.AddUser("alice");
  const auto season = fx.OpenSeason(10, 3, 10, kPrice);
  fx.ledger->AddTransfer(1, "alice-wallet", kRecipient, kPrice);
  fx.ledger->FailWith("ledger unavailable");

  assert(Throws<registry::util::PaymentNotVerified>([&] { fx.orchestrator->Register("alice", fx.Request("abc", season, 1)); }));
  assert(!fx.payments->IsReferenceUsed(1));
  assert(NameCount(fx) == 0);
}

// season closes while the ledger is being queried
void TestRecheckAfterVerification() {
  RegistryFixture fx;
  fx.AddUser("alice");
  const auto season = fx.OpenSeason(10, 3, 10, kPrice);
  fx.ledger->AddTransfer(1, "alice-wallet", kRecipient, kPrice);
  fx.ledger->OnQuery([&](uint64_t) { fx.seasons->Cancel(kAdmin, season); });

  assert(Throws<registry::util::SeasonNotOpen>([&] { fx.orchestrator->Register("alice", fx.Request("abc", season, 1)); }));
  assert(!fx.payments->IsReferenceUsed(1));
  assert(NameCount(fx) == 0);
}

void TestAdminAddName() {
  RegistryFixture fx;
  fx.AddUser("alice");

  registry::core::AdminNameRequest request;
  request.name    = "x";
  request.address = "aaaaa-aa";
  request.owner   = "carol";

  // no active season: no length bounds, season id 0
  fx.orchestrator->AdminAddName(kAdmin, request);
  assert(fx.names->Get("x").season_id == 0);
  assert(fx.names->Get("x").owner == "carol");

  assert(Throws<registry::util::Unauthorized>([&] { fx.orchestrator->AdminAddName("alice", request); }));

  request.owner = "dave";
  assert(Throws<registry::util::NameTaken>([&] { fx.orchestrator->AdminAddName(kAdmin, request); }));

  request.name  = "other";
  request.owner = "carol";
  assert(Throws<registry::util::AlreadyRegistered>([&] { fx.orchestrator->AdminAddName(kAdmin, request); }));

  request.owner = "";
  assert(Throws<registry::util::Unauthorized>([&] { fx.orchestrator->AdminAddName(kAdmin, request); }));

  const auto season = fx.OpenSeason(10, 3, 10, kPrice);
  request.owner     = "dave";
  request.name      = "ab";
  assert(Throws<registry::util::InvalidNameLength>([&] { fx.orchestrator->AdminAddName(kAdmin, request); }));

  request.name = "dave";
  fx.orchestrator->AdminAddName(kAdmin, request);
  assert(fx.names->Get("dave").season_id == season);

  // an admin-added owner cannot buy a second name
  fx.AddUser("dave");
  fx.ledger->AddTransfer(9, "dave-wallet", kRecipient, kPrice);
  assert(Throws<registry::util::AlreadyRegistered>([&] { fx.orchestrator->Register("dave", fx.Request("again", season, 9)); }));

  request.owner = "erin";
  request.name  = "\xff\xfe\xfd";
  assert(Throws<registry::util::InvalidNameLength>([&] { fx.orchestrator->AdminAddName(kAdmin, request); }));
}

// admin additions count against the active season like paid ones
void TestAdminAddNameRespectsCapacity() {
  RegistryFixture fx;
  fx.AddUser("alice");
  const auto season = fx.OpenSeason(1, 3, 10, kPrice);
  fx.ledger->AddTransfer(1, "alice-wallet", kRecipient, kPrice);
  fx.orchestrator->Register("alice", fx.Request("abc", season, 1));

  registry::core::AdminNameRequest request;
  request.name    = "carol";
  request.address = "aaaaa-aa";
  request.owner   = "carol";
  assert(Throws<registry::util::SeasonNotOpen>([&] { fx.orchestrator->AdminAddName(kAdmin, request); }));
  assert(NameCount(fx) == 1);
  assert(!fx.names->IsNameTaken("carol"));

  // once the season ends the name lands outside any season
  fx.seasons->End(kAdmin, season);
  fx.orchestrator->AdminAddName(kAdmin, request);
  assert(fx.names->Get("carol").season_id == 0);
}

} // namespace

int main() {
  TestPaidRegistrationWritesPaymentNameAndSubscription();
  TestScenarioReplayedBlock();
  TestScenarioNameTooShort();
  TestNameLengthCountsCodePoints();
  TestMalformedUtf8IsInvalidLength();
  TestScenarioOwnerAlreadyRegistered();
  TestScenarioSeasonAtCapacity();
  TestGuestCannotRegister();
  TestNameTakenAcrossSeasons();
  TestSeasonMustBeOpen();
  TestUnverifiedPaymentsChangeNothing();
  TestLedgerFailureIsNotVerified();
  TestRecheckAfterVerification();
  TestAdminAddName();
  TestAdminAddNameRespectsCapacity();

  std::cout << "name_registry_unit_registration_orchestrator: pass\n";
  return 0;
}
