#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/availability_reporter.hpp"
#include "internal/core/booking_manager.hpp"
#include "internal/core/catalog_seeder.hpp"
#include "internal/core/turn_time_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/availability_server.hpp"
#include "internal/grpc/booking_server.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/lock/lock_sweeper.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/availability_service.hpp"
#include "internal/service/booking_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if TABLEBOOK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TABLEBOOK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace tablebook::factory {

using namespace tablebook;

namespace {

#if TABLEBOOK_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,name,definition_json,updated_at_ms FROM restaurants LIMIT 1;");
  sqlite_db->Exec("SELECT booking_id,table_id,position,date,start_minute,end_minute,active FROM booking_tables LIMIT 1;");
}
#endif

#if TABLEBOOK_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,name,definition_json,updated_at_ms FROM restaurants LIMIT 1;");
  tx.exec("SELECT booking_id,table_id,position,date,start_minute,end_minute,active FROM booking_tables LIMIT 1;");
  tx.commit();
}
#endif

core::ReporterOptions ReporterOptionsFrom(const runtime::config::AvailabilityConfig& config) {
  core::ReporterOptions options;
  if (config.default_slot_interval_minutes() > 0) options.default_interval_minutes = config.default_slot_interval_minutes();
  if (config.max_alternatives() > 0) options.max_alternatives = config.max_alternatives();
  if (config.max_suggestions() > 0) options.max_suggestions = config.max_suggestions();
  return options;
}

core::BookingOptions BookingOptionsFrom(const runtime::config::AvailabilityConfig& config) {
  core::BookingOptions options;
  if (config.default_slot_interval_minutes() > 0) options.default_interval_minutes = config.default_slot_interval_minutes();
  if (config.min_override_reason_length() > 0) options.min_override_reason_length = config.min_override_reason_length();
  return options;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TABLEBOOK_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode = database.sqlite().wal_mode();
    if (database.sqlite().busy_timeout_ms() > 0) options.busy_timeout_ms = database.sqlite().busy_timeout_ms();

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TABLEBOOK_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  TABLEBOOK_LOG_INFO("repository ready", {observability::StringField("backend", app.repository->BackendName())});

  if (!config.catalog_path().empty()) {
    const auto catalog = config::ConfigLoader::LoadCatalogFromYaml(config.catalog_path());
    core::CatalogSeeder::Seed(*app.repository, catalog, util::ToUnixMillis(util::Now()));
  }

  // ------------------------------------------------------------------
  // Locking
  // ------------------------------------------------------------------
  const auto lock_options = lock::LockOptions::FromConfig(config.locking());
  app.locks               = std::make_shared<lock::LockCoordinator>(lock_options);

  auto sweeper = std::make_shared<lock::LockSweeper>(app.locks, lock_options.sweep_interval);
  sweeper->Start();
  app.background_workers.push_back(sweeper);

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  const auto& availability = config.availability();
  auto        turn_times   = std::make_shared<core::TurnTimeResolver>(
      app.repository, availability.default_turn_time_minutes() > 0 ? availability.default_turn_time_minutes()
                                                                    : core::TurnTimeResolver::kDefaultTurnTimeMinutes);

  app.reporter = std::make_shared<core::AvailabilityReporter>(app.repository, turn_times, ReporterOptionsFrom(availability));
  app.bookings = std::make_shared<core::BookingManager>(app.repository, app.locks, turn_times, BookingOptionsFrom(availability));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.reporter   = app.reporter;
  ctx.bookings   = app.bookings;
  ctx.locks      = app.locks;
  ctx.repository = app.repository;

  auto availability_service = std::make_shared<service::AvailabilityService>(ctx);
  auto booking_service      = std::make_shared<service::BookingService>(ctx);
  auto admin_service        = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AvailabilityServer>(availability_service));
  app.grpc_services.push_back(std::make_unique<grpc::BookingServer>(booking_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace tablebook::factory
