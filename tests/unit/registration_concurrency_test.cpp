#include <atomic>
#include <cassert>
#include <iostream>
#include <latch>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/registry_fixture.hpp"

namespace {

using registry::testing::kRecipient;
using registry::testing::RegistryFixture;

constexpr uint64_t kPrice = 100;

enum class Outcome { kRegistered, kReplayed, kNotOpen, kOther };

Outcome RegisterOnce(RegistryFixture& fx, const std::string& caller, const std::string& name, uint64_t season, uint64_t block) {
  try {
    fx.orchestrator->Register(caller, fx.Request(name, season, block));
    return Outcome::kRegistered;
  } catch (const registry::util::ReplayedPayment&) {
    return Outcome::kReplayed;
  } catch (const registry::util::SeasonNotOpen&) {
    return Outcome::kNotOpen;
  } catch (const std::exception& e) {
    std::cerr << "unexpected: " << e.what() << "\n";
    return Outcome::kOther;
  }
}

// Both callers pass the first check before either reaches the write section.
void TestSameBlockFromTwoCallersRegistersOnce() {
  RegistryFixture fx;
  fx.AddUser("alice");
  fx.AddUser("bob");
  const auto season = fx.OpenSeason(10, 3, 10, kPrice);
  fx.ledger->AddTransfer(1, "alice-wallet", kRecipient, kPrice);

  std::latch both_verifying(2);
  fx.ledger->OnQuery([&](uint64_t) { both_verifying.arrive_and_wait(); });

  Outcome     alice_outcome = Outcome::kOther;
  Outcome     bob_outcome   = Outcome::kOther;
  std::thread alice([&] { alice_outcome = RegisterOnce(fx, "alice", "alpha", season, 1); });
  std::thread bob([&] { bob_outcome = RegisterOnce(fx, "bob", "bravo", season, 1); });
  alice.join();
  bob.join();

  assert(fx.ledger->Queries() == 2);
  const int registered = (alice_outcome == Outcome::kRegistered) + (bob_outcome == Outcome::kRegistered);
  const int replayed   = (alice_outcome == Outcome::kReplayed) + (bob_outcome == Outcome::kReplayed);
  assert(registered == 1);
  assert(replayed == 1);

  assert(fx.names->List().size() == 1);
  assert(fx.payments->All().size() == 1);
}

void TestCapacityHoldsUnderContention() {
  constexpr int      kCallers  = 8;
  constexpr uint64_t kCapacity = 3;

  RegistryFixture fx;
  const auto      season = fx.OpenSeason(kCapacity, 3, 10, kPrice);
  for (int i = 0; i < kCallers; ++i) {
    fx.AddUser("user-" + std::to_string(i));
    fx.ledger->AddTransfer(100 + i, "wallet", kRecipient, kPrice);
  }

  std::atomic<int>         registered{0};
  std::atomic<int>         rejected{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kCallers; ++i) {
    threads.emplace_back([&, i] {
      const auto outcome = RegisterOnce(fx, "user-" + std::to_string(i), "name-" + std::to_string(i), season, 100 + i);
      if (outcome == Outcome::kRegistered) ++registered;
      if (outcome == Outcome::kNotOpen) ++rejected;
    });
  }
  for (auto& thread : threads) thread.join();

  assert(registered.load() == static_cast<int>(kCapacity));
  assert(rejected.load() == kCallers - static_cast<int>(kCapacity));
  assert(fx.names->List().size() == kCapacity);
  assert(fx.seasons->ActiveInfo().available_names == 0);
}

} // namespace

int main() {
  TestSameBlockFromTwoCallersRegistersOnce();
  TestCapacityHoldsUnderContention();

  std::cout << "name_registry_unit_registration_concurrency: pass\n";
  return 0;
}
