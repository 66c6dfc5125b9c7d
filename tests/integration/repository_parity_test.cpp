#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/registry_fixture.hpp"

#if REGISTRY_DB_SQLITE || REGISTRY_DB_POSTGRES
#include "internal/db/sql/schema.hpp"
#endif

#if REGISTRY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if REGISTRY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using registry::db::ErrorCode;
using registry::db::Repository;
using registry::db::TxMode;
using registry::db::memory::MemoryRepository;
using registry::db::model::NameRecord;
using registry::db::model::PaymentRecord;
using registry::db::model::SeasonRecord;
using registry::db::model::SubscriptionRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  // false when the backend may hold rows from earlier runs
  bool starts_empty = true;
};

// Keys that cannot collide with rows left by an earlier run.
struct Keys {
  explicit Keys(const std::string& backend) : prefix(backend + "-" + std::to_string(NowMs())), block_base(NowMs() * 1000) {
  }

  std::string Name(const std::string& suffix) const {
    return prefix + "-" + suffix;
  }

  std::string prefix;
  uint64_t    block_base;
};

SeasonRecord MakeSeason(const std::string& name) {
  SeasonRecord season;
  season.name            = name;
  season.start_time      = 10;
  season.end_time        = 20;
  season.max_names       = 3;
  season.min_name_length = 1;
  season.max_name_length = 32;
  season.price           = 100'000'000;
  season.created_at      = 1;
  season.updated_at      = 1;
  return season;
}

NameRecord MakeName(const std::string& name, const std::string& owner, uint64_t season_id) {
  NameRecord record;
  record.name         = name;
  record.address      = "aaaaa-aa";
  record.address_type = registry::v1::ADDRESS_TYPE_CANISTER;
  record.owner        = owner;
  record.season_id    = season_id;
  record.created_at   = 5;
  record.updated_at   = 5;
  return record;
}

void VerifySeasons(Repository& repo, const Keys& keys) {
  auto tx = repo.Begin(TxMode::ReadWrite);

  auto first  = MakeSeason(keys.Name("spring"));
  auto second = MakeSeason(keys.Name("summer"));
  assert(repo.InsertSeason(*tx, first));
  assert(repo.InsertSeason(*tx, second));
  assert(first.id > 0);
  assert(second.id > first.id);

  auto read = repo.GetSeason(*tx, first.id);
  assert(read.has_value());
  assert(read->name == first.name);
  assert(read->price == first.price);
  assert(read->status == registry::v1::SEASON_STATUS_DRAFT);

  read->status     = registry::v1::SEASON_STATUS_ACTIVE;
  read->updated_at = 9;
  assert(repo.UpdateSeason(*tx, *read));
  assert(repo.GetSeason(*tx, first.id)->status == registry::v1::SEASON_STATUS_ACTIVE);

  auto missing = MakeSeason("missing");
  missing.id   = second.id + 1000;
  assert(repo.UpdateSeason(*tx, missing).code == ErrorCode::NotFound);

  const auto seasons = repo.ListSeasons(*tx);
  assert(seasons.size() >= 2);
  for (std::size_t i = 1; i < seasons.size(); ++i) {
    assert(seasons[i - 1].id < seasons[i].id);
  }

  tx->Commit();
}

void VerifyNameUniqueness(Repository& repo, const Keys& keys) {
  auto tx = repo.Begin(TxMode::ReadWrite);

  const auto owner = keys.Name("owner");
  assert(repo.InsertName(*tx, MakeName(keys.Name("alpha"), owner, 7)));

  // duplicate name and duplicate owner both fail and leave the transaction usable
  assert(repo.InsertName(*tx, MakeName(keys.Name("alpha"), keys.Name("other"), 7)).code == ErrorCode::AlreadyExists);
  assert(repo.InsertName(*tx, MakeName(keys.Name("beta"), owner, 7)).code == ErrorCode::AlreadyExists);
  assert(repo.InsertName(*tx, MakeName(keys.Name("gamma"), keys.Name("other"), 7)));

  auto by_owner = repo.GetNameByOwner(*tx, owner);
  assert(by_owner.has_value());
  assert(by_owner->name == keys.Name("alpha"));
  assert(by_owner->address_type == registry::v1::ADDRESS_TYPE_CANISTER);
  assert(!repo.GetName(*tx, keys.Name("beta")).has_value());

  assert(repo.TouchName(*tx, keys.Name("alpha"), 77));
  assert(repo.GetName(*tx, keys.Name("alpha"))->updated_at == 77);
  assert(repo.TouchName(*tx, keys.Name("nope"), 77).code == ErrorCode::NotFound);

  tx->Commit();

  auto read_tx = repo.Begin(TxMode::ReadOnly);
  assert(repo.GetName(*read_tx, keys.Name("gamma")).has_value());
  read_tx->Rollback();
}

void VerifyPayments(Repository& repo, const Keys& keys) {
  auto tx = repo.Begin(TxMode::ReadWrite);

  const auto block = keys.block_base + 1;
  assert(!repo.IsBlockConsumed(*tx, block));
  assert(repo.InsertConsumedBlock(*tx, block, 3));
  assert(repo.InsertConsumedBlock(*tx, block, 4).code == ErrorCode::AlreadyExists);
  assert(repo.IsBlockConsumed(*tx, block));

  PaymentRecord payment;
  payment.payer             = keys.Name("payer");
  payment.amount            = 100;
  payment.block_index       = block;
  payment.verified_at       = 3;
  payment.registration_name = keys.Name("paid");
  assert(repo.InsertPayment(*tx, payment));
  assert(payment.id > 0);

  PaymentRecord replay = payment;
  replay.id            = 0;
  assert(repo.InsertPayment(*tx, replay).code == ErrorCode::AlreadyExists);

  PaymentRecord next = payment;
  next.id            = 0;
  next.block_index   = block + 1;
  assert(repo.InsertPayment(*tx, next));
  assert(next.id > payment.id);

  auto by_block = repo.GetPaymentByBlock(*tx, block);
  assert(by_block.has_value());
  assert(by_block->id == payment.id);
  assert(by_block->registration_name == payment.registration_name);

  assert(repo.ListPaymentsByPayer(*tx, keys.Name("payer")).size() == 2);
  assert(repo.ListPaymentsByPayer(*tx, keys.Name("nobody")).empty());

  tx->Commit();
}

void VerifySubscriptionsRolesAndContent(Repository& repo, const Keys& keys) {
  auto tx = repo.Begin(TxMode::ReadWrite);

  SubscriptionRecord subscription;
  subscription.user            = keys.Name("subscriber");
  subscription.registered_name = keys.Name("alpha");
  subscription.start_time      = 1;
  subscription.end_time        = 2;
  subscription.payment_id      = 1;
  assert(repo.InsertSubscription(*tx, subscription));
  assert(repo.InsertSubscription(*tx, subscription).code == ErrorCode::AlreadyExists);
  assert(repo.DeactivateAllSubscriptions(*tx));
  assert(!repo.GetSubscription(*tx, subscription.user)->is_active);

  const auto principal = keys.Name("principal");
  assert(repo.UpsertRole(*tx, {principal, registry::v1::USER_ROLE_USER}));
  assert(repo.UpsertRole(*tx, {principal, registry::v1::USER_ROLE_ADMIN}));
  assert(repo.GetRole(*tx, principal)->role == registry::v1::USER_ROLE_ADMIN);

  assert(repo.UpsertProfile(*tx, {principal, "first"}));
  assert(repo.UpsertProfile(*tx, {principal, "second"}));
  assert(repo.GetProfile(*tx, principal)->name == "second");

  registry::db::model::MetadataRecord metadata;
  metadata.name  = keys.Name("alpha");
  metadata.title = "title";
  assert(repo.UpsertMetadata(*tx, metadata));
  metadata.title = "retitled";
  assert(repo.UpsertMetadata(*tx, metadata));
  assert(repo.GetMetadata(*tx, metadata.name)->title == "retitled");

  registry::db::model::MarkdownRecord markdown;
  markdown.name    = keys.Name("alpha");
  markdown.content = "# hello";
  assert(repo.UpsertMarkdown(*tx, markdown));
  assert(repo.GetMarkdown(*tx, markdown.name)->content == "# hello");

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const Keys& keys) {
  {
    auto tx = repo.Begin(TxMode::ReadWrite);
    assert(repo.InsertName(*tx, MakeName(keys.Name("rolled-back"), keys.Name("rb-owner"), 0)));
    assert(repo.InsertConsumedBlock(*tx, keys.block_base + 50, 1));
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx = repo.Begin(TxMode::ReadWrite);
    assert(repo.InsertName(*tx, MakeName(keys.Name("dropped"), keys.Name("drop-owner"), 0)));
  }

  auto check_tx = repo.Begin(TxMode::ReadOnly);
  assert(!repo.GetName(*check_tx, keys.Name("rolled-back")).has_value());
  assert(!repo.GetName(*check_tx, keys.Name("dropped")).has_value());
  assert(!repo.GetNameByOwner(*check_tx, keys.Name("rb-owner")).has_value());
  assert(!repo.IsBlockConsumed(*check_tx, keys.block_base + 50));
  check_tx->Rollback();
}

void VerifyRestartDurability(BackendFactory& backend, const Keys& keys) {
  if (!backend.supports_restart()) {
    return;
  }

  auto     repo = backend.make_repository();
  uint64_t season_id{};
  {
    auto tx     = repo->Begin(TxMode::ReadWrite);
    auto season = MakeSeason(keys.Name("durable"));
    assert(repo->InsertSeason(*tx, season));
    season_id = season.id;
    assert(repo->InsertName(*tx, MakeName(keys.Name("durable"), keys.Name("durable-owner"), season_id)));
    assert(repo->InsertConsumedBlock(*tx, keys.block_base + 99, 1));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin(TxMode::ReadWrite);
  assert(repo->GetSeason(*tx, season_id).has_value());
  assert(repo->GetName(*tx, keys.Name("durable"))->season_id == season_id);
  assert(repo->IsBlockConsumed(*tx, keys.block_base + 99));
  assert(repo->CountNamesInSeason(*tx, season_id) == 1);

  // ids keep growing after a reopen
  auto later = MakeSeason(keys.Name("later"));
  assert(repo->InsertSeason(*tx, later));
  assert(later.id > season_id);
  tx->Commit();
}

// The whole registration flow on top of the backend.
void VerifyRegistrationFlow(BackendFactory& backend) {
  if (!backend.starts_empty) {
    return;
  }

  registry::testing::RegistryFixture fx(backend.make_repository());
  fx.AddUser("alice");
  fx.AddUser("bob");
  const auto season = fx.OpenSeason(5, 3, 10, 100);
  fx.ledger->AddTransfer(1, "alice-wallet", registry::testing::kRecipient, 100);

  const auto payment_id = fx.orchestrator->Register("alice", fx.Request("alpha", season, 1));
  assert(payment_id > 0);
  assert(registry::testing::Throws<registry::util::ReplayedPayment>(
      [&] { fx.orchestrator->Register("bob", fx.Request("bravo", season, 1)); }));

  assert(fx.names->Get("alpha").owner == "alice");
  assert(fx.payments->GetByBlock(1)->id == payment_id);
  assert(fx.seasons->ActiveInfo().available_names == 4);
}

void VerifyMemoryReadOnly() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin(TxMode::ReadWrite);
    assert(repo.UpsertRole(*tx, {"reader", registry::v1::USER_ROLE_USER}));
    tx->Commit();
  }

  auto tx = repo.Begin(TxMode::ReadOnly);
  assert(tx->Mode() == TxMode::ReadOnly);
  assert(repo.GetRole(*tx, "reader").has_value());

  bool rejected = false;
  try {
    (void)repo.UpsertRole(*tx, {"writer", registry::v1::USER_ROLE_USER});
  } catch (const std::logic_error&) {
    rejected = true;
  }
  assert(rejected);
  tx->Commit();

  auto check = repo.Begin(TxMode::ReadOnly);
  assert(!repo.GetRole(*check, "writer").has_value());
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
      .starts_empty     = true,
  };
}

#if REGISTRY_DB_SQLITE
BackendFactory MakeSqliteFactory(const std::string& tag) {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("name_registry_integration_" + tag + "_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<registry::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : registry::db::sql::SqliteSchema()) {
      db->Exec(sql);
    }
    return std::make_shared<registry::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = tag,
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .starts_empty = false,
  };
}
#endif

#if REGISTRY_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("REGISTRY_TEST_PG_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("REGISTRY_TEST_PG_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto       pool = std::make_shared<registry::db::postgres::PgPool>(conninfo);
    auto       conn = pool->Acquire();
    pqxx::work tx(*conn);
    for (const auto& sql : registry::db::sql::PostgresSchema()) {
      tx.exec(sql);
    }
    tx.commit();
    return std::make_shared<registry::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
      .starts_empty     = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const Keys keys(backend.name);

  {
    auto repo = backend.make_repository();
    VerifySeasons(*repo, keys);
    VerifyNameUniqueness(*repo, keys);
    VerifyPayments(*repo, keys);
    VerifySubscriptionsRolesAndContent(*repo, keys);
    VerifyRollbackBehavior(*repo, keys);
  }

  VerifyRestartDurability(backend, keys);
  VerifyRegistrationFlow(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if REGISTRY_DB_SQLITE
  backends.push_back(MakeSqliteFactory("sqlite"));

  // a fresh sqlite file for the end-to-end flow
  auto fresh         = MakeSqliteFactory("sqlite-fresh");
  fresh.starts_empty = true;
#endif

#if REGISTRY_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  VerifyMemoryReadOnly();

#if REGISTRY_DB_SQLITE
  VerifyRegistrationFlow(fresh);
  fresh.cleanup();
#endif

  std::cout << "name_registry_integration_repository_parity: pass\n";
  return 0;
}
