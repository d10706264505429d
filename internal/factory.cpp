#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/geofence/catalog.hpp"
#include "internal/milestone/milestone_builder.hpp"
#include "internal/observability/logging.hpp"
#if FREIGHTLINE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FREIGHTLINE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace freightline::factory {

namespace {

#if FREIGHTLINE_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  sqlite_db->Exec(db::sql::kSqliteSchema);
  sqlite_db->Exec("SELECT id,token_type,version,state,payload,root_shipment_id,signature,created_at_ms,updated_at_ms FROM tokens LIMIT 1;");
}
#endif

#if FREIGHTLINE_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  tx.exec(db::sql::kPostgresSchema);
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const freightline::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FREIGHTLINE_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    FREIGHTLINE_LOG_INFO("token store ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FREIGHTLINE_DB_POSTGRES
    const auto& pg   = database.postgres();
    auto        pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() == 0 ? 16 : pg.max_connections());
    BootstrapPostgresSchema(pool);
    FREIGHTLINE_LOG_INFO("token store ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  FREIGHTLINE_LOG_INFO("token store ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full pipeline dependency graph
*/
RuntimeDependencies BuildRuntime(const freightline::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Tokens
  // ------------------------------------------------------------------
  deps.repository    = BuildRepository(config);
  deps.index         = std::make_shared<token::TokenIndex>();
  deps.registry      = std::make_shared<registry::TokenRegistry>(deps.repository);
  deps.token_factory = std::make_shared<token::TokenFactory>(*deps.index);

  const auto hydrated = deps.registry->HydrateIndex(*deps.index);
  FREIGHTLINE_LOG_INFO("token index hydrated", {observability::IntField("tokens", static_cast<std::int64_t>(hydrated))});

  // ------------------------------------------------------------------
  // Engines
  // ------------------------------------------------------------------
  deps.consistency = std::make_shared<consistency::ConsistencyEngine>(consistency::ConsistencyThresholds::FromConfig(config.consistency()));
  deps.geofences   = std::make_shared<geofence::GeofenceEngine>();
  deps.catalog     = geofence::LoadCatalog(config);
  FREIGHTLINE_LOG_INFO("geofence catalogue loaded", {observability::IntField("geofences", static_cast<std::int64_t>(deps.catalog.size()))});

  milestone::MilestoneBuilder builder(milestone::MilestoneThresholds::FromConfig(config.milestones()));

  pipeline::PipelineOptions options;
  options.persist_tokens      = config.pipeline().persist_tokens();
  options.idle_retention      = std::chrono::seconds(config.pipeline().idle_retention_seconds());
  if (config.pipeline().sweep_every_samples() > 0) {
    options.sweep_every_samples = config.pipeline().sweep_every_samples();
  }
  options.allow_reaffirmation = config.milestones().allow_reaffirmation();

  deps.pipeline = std::make_shared<pipeline::TelemetryPipeline>(deps.consistency, deps.geofences, deps.catalog, builder,
                                                                deps.token_factory, deps.registry, options);
  return deps;
}

} // namespace freightline::factory
