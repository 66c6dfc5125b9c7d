#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/access/access_control.hpp"
#include "internal/core/registration_orchestrator.hpp"
#include "internal/core/state_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/access_server.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/content_server.hpp"
#include "internal/grpc/registration_server.hpp"
#include "internal/grpc/season_server.hpp"
#include "internal/names/name_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payment/grpc_ledger_client.hpp"
#include "internal/payment/payment_verifier.hpp"
#include "internal/season/season_registry.hpp"
#include "internal/service/access_service.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/content_service.hpp"
#include "internal/service/registration_service.hpp"
#include "internal/service/season_service.hpp"
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

namespace registry::factory {

namespace {

#if REGISTRY_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if REGISTRY_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const registry::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if REGISTRY_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    REGISTRY_LOG_INFO("Using sqlite repository", {observability::StringField("path", sqlite_db->Path()),
                                                   observability::BoolField("wal_mode", database.sqlite().wal_mode())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if REGISTRY_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    REGISTRY_LOG_INFO("Using postgres repository", {observability::UintField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  REGISTRY_LOG_WARN("Using in-memory repository; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const registry::runtime::config::RuntimeConfig& config, std::shared_ptr<payment::LedgerClient> ledger) {
  Application app;

  // ------------------------------------------------------------------
  // State
  // ------------------------------------------------------------------
  auto store = std::make_shared<core::StateStore>(BuildRepository(config));

  // ------------------------------------------------------------------
  // Ledger
  // ------------------------------------------------------------------
  if (!ledger) {
    ledger = payment::GrpcLedgerClient::Connect(config.ledger().endpoint(), config.ledger().use_tls(),
                                                std::chrono::milliseconds(config.ledger().deadline_ms()));
    REGISTRY_LOG_INFO("Using ledger endpoint", {observability::StringField("endpoint", config.ledger().endpoint()),
                                                observability::BoolField("use_tls", config.ledger().use_tls()),
                                                observability::UintField("deadline_ms", config.ledger().deadline_ms())});
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto access_control   = std::make_shared<access::AccessControl>(store);
  auto name_ledger      = std::make_shared<names::NameLedger>(store);
  auto season_registry  = std::make_shared<season::SeasonRegistry>(store, access_control, name_ledger);
  auto payment_verifier = std::make_shared<payment::PaymentVerifier>(store, std::move(ledger));

  core::RegistrationOptions options;
  options.recipient         = config.payment().recipient_account();
  options.subscription_days = config.registration().subscription_days() > 0 ? config.registration().subscription_days() : 365;

  auto orchestrator = std::make_shared<core::RegistrationOrchestrator>(store, access_control, season_registry, name_ledger, payment_verifier, options);

  if (const auto& admin = config.access().bootstrap_admin(); !admin.empty() && access_control->SeedAdmin(admin)) {
    REGISTRY_LOG_INFO("Seeded bootstrap admin", {observability::StringField("principal", admin)});
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto& ctx        = app.context;
  ctx.store        = store;
  ctx.access       = access_control;
  ctx.seasons      = season_registry;
  ctx.names        = name_ledger;
  ctx.payments     = payment_verifier;
  ctx.orchestrator = orchestrator;

  auto season_service       = std::make_shared<service::SeasonService>(ctx);
  auto registration_service = std::make_shared<service::RegistrationService>(ctx);
  auto access_service       = std::make_shared<service::AccessService>(ctx);
  auto content_service      = std::make_shared<service::ContentService>(ctx);
  auto admin_service        = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::SeasonServer>(season_service));
  app.grpc_services.push_back(std::make_unique<grpc::RegistrationServer>(registration_service));
  app.grpc_services.push_back(std::make_unique<grpc::AccessServer>(access_service));
  app.grpc_services.push_back(std::make_unique<grpc::ContentServer>(content_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace registry::factory
