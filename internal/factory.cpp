#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/collaboration_graph.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/aggregate_store.hpp"
#include "internal/graph/edge_builder.hpp"
#include "internal/graph/path_cache_writer.hpp"
#include "internal/graph/path_finder.hpp"
#include "internal/graph/trend_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/population/apply_worker_pool.hpp"
#include "internal/runtime/maintenance_worker.hpp"
#include "internal/service/graph_service.hpp"
#include "internal/service/service_context.hpp"
#if COLLAB_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if COLLAB_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace collab::factory {

namespace {

constexpr int kSchemaVersion = 1;

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration) {
  return std::chrono::seconds(duration.seconds()) + std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(duration.nanos()));
}

#if COLLAB_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS works (work_id INTEGER PRIMARY KEY, release_year INTEGER NOT NULL, rating REAL, revenue INTEGER, genres TEXT NOT NULL DEFAULT '[]');",
      "CREATE TABLE IF NOT EXISTS credits (work_id INTEGER NOT NULL REFERENCES works(work_id) ON DELETE CASCADE, person_id INTEGER, role_kind INTEGER NOT NULL, role_name TEXT NOT NULL DEFAULT '', billing_ordinal INTEGER);",
      "CREATE INDEX IF NOT EXISTS credits_work_idx ON credits(work_id);",
      "CREATE INDEX IF NOT EXISTS credits_person_idx ON credits(person_id);",
      "CREATE TABLE IF NOT EXISTS collaborations (person_low_id INTEGER NOT NULL, person_high_id INTEGER NOT NULL, collaboration_count INTEGER NOT NULL, first_year INTEGER NOT NULL, last_year INTEGER NOT NULL, avg_rating REAL, total_revenue INTEGER NOT NULL, types INTEGER NOT NULL, years_active TEXT NOT NULL, peak_year INTEGER NOT NULL, genre_diversity REAL NOT NULL, role_diversity REAL NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (person_low_id, person_high_id), CHECK (person_low_id < person_high_id));",
      "CREATE INDEX IF NOT EXISTS collaborations_high_idx ON collaborations(person_high_id, person_low_id);",
      "CREATE TABLE IF NOT EXISTS collaboration_details (person_low_id INTEGER NOT NULL, person_high_id INTEGER NOT NULL, work_id INTEGER NOT NULL, collaboration_type INTEGER NOT NULL, low_role INTEGER NOT NULL, high_role INTEGER NOT NULL, release_year INTEGER NOT NULL, rating REAL, revenue INTEGER, genres TEXT NOT NULL DEFAULT '[]', PRIMARY KEY (person_low_id, person_high_id, work_id), CHECK (person_low_id < person_high_id));",
      "CREATE INDEX IF NOT EXISTS collaboration_details_high_idx ON collaboration_details(person_high_id);",
      "CREATE TABLE IF NOT EXISTS path_cache (person_low_id INTEGER NOT NULL, person_high_id INTEGER NOT NULL, path TEXT NOT NULL, path_length INTEGER NOT NULL, computed_at_ms INTEGER NOT NULL, PRIMARY KEY (person_low_id, person_high_id), CHECK (person_low_id < person_high_id));",
      "CREATE INDEX IF NOT EXISTS path_cache_computed_idx ON path_cache(computed_at_ms);",
      "CREATE TABLE IF NOT EXISTS trend_snapshot (person_low_id INTEGER NOT NULL, person_high_id INTEGER NOT NULL, trend_score REAL NOT NULL, recent_count INTEGER NOT NULL, baseline_count INTEGER NOT NULL, last_year INTEGER NOT NULL, refreshed_at_ms INTEGER NOT NULL, PRIMARY KEY (person_low_id, person_high_id), CHECK (person_low_id < person_high_id));",
      "CREATE TABLE IF NOT EXISTS collab_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO collab_schema_migrations(version, applied_at_ms) VALUES (" + std::to_string(kSchemaVersion) +
          ", CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT work_id,release_year,rating,revenue,genres FROM works LIMIT 1;");
  sqlite_db->Exec("SELECT person_low_id,person_high_id,types,years_active FROM collaborations LIMIT 1;");
  sqlite_db->Exec("SELECT person_low_id,person_high_id,work_id,collaboration_type FROM collaboration_details LIMIT 1;");
}
#endif

#if COLLAB_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS works (work_id BIGINT PRIMARY KEY, release_year INTEGER NOT NULL, rating DOUBLE PRECISION, revenue BIGINT, genres TEXT NOT NULL DEFAULT '[]');");
  tx.exec("CREATE TABLE IF NOT EXISTS credits (work_id BIGINT NOT NULL REFERENCES works(work_id) ON DELETE CASCADE, person_id BIGINT, role_kind SMALLINT NOT NULL, role_name TEXT NOT NULL DEFAULT '', billing_ordinal INTEGER);");
  tx.exec("CREATE INDEX IF NOT EXISTS credits_work_idx ON credits(work_id);");
  tx.exec("CREATE INDEX IF NOT EXISTS credits_person_idx ON credits(person_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS collaborations (person_low_id BIGINT NOT NULL, person_high_id BIGINT NOT NULL, collaboration_count BIGINT NOT NULL, first_year INTEGER NOT NULL, last_year INTEGER NOT NULL, avg_rating DOUBLE PRECISION, total_revenue BIGINT NOT NULL, types BIGINT NOT NULL, years_active TEXT NOT NULL, peak_year INTEGER NOT NULL, genre_diversity DOUBLE PRECISION NOT NULL, role_diversity DOUBLE PRECISION NOT NULL, updated_at_ms BIGINT NOT NULL, PRIMARY KEY (person_low_id, person_high_id), CHECK (person_low_id < person_high_id));");
  tx.exec("CREATE INDEX IF NOT EXISTS collaborations_high_idx ON collaborations(person_high_id, person_low_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS collaboration_details (person_low_id BIGINT NOT NULL, person_high_id BIGINT NOT NULL, work_id BIGINT NOT NULL, collaboration_type SMALLINT NOT NULL, low_role SMALLINT NOT NULL, high_role SMALLINT NOT NULL, release_year INTEGER NOT NULL, rating DOUBLE PRECISION, revenue BIGINT, genres TEXT NOT NULL DEFAULT '[]', PRIMARY KEY (person_low_id, person_high_id, work_id), CHECK (person_low_id < person_high_id));");
  tx.exec("CREATE INDEX IF NOT EXISTS collaboration_details_high_idx ON collaboration_details(person_high_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS path_cache (person_low_id BIGINT NOT NULL, person_high_id BIGINT NOT NULL, path TEXT NOT NULL, path_length INTEGER NOT NULL, computed_at_ms BIGINT NOT NULL, PRIMARY KEY (person_low_id, person_high_id), CHECK (person_low_id < person_high_id));");
  tx.exec("CREATE INDEX IF NOT EXISTS path_cache_computed_idx ON path_cache(computed_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS trend_snapshot (person_low_id BIGINT NOT NULL, person_high_id BIGINT NOT NULL, trend_score DOUBLE PRECISION NOT NULL, recent_count BIGINT NOT NULL, baseline_count BIGINT NOT NULL, last_year INTEGER NOT NULL, refreshed_at_ms BIGINT NOT NULL, PRIMARY KEY (person_low_id, person_high_id), CHECK (person_low_id < person_high_id));");
  tx.exec("CREATE TABLE IF NOT EXISTS collab_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());");
  tx.exec("INSERT INTO collab_schema_migrations(version) VALUES (" + std::to_string(kSchemaVersion) + ") ON CONFLICT DO NOTHING;");

  tx.exec("SELECT work_id,release_year,rating,revenue,genres FROM works LIMIT 1;");
  tx.exec("SELECT person_low_id,person_high_id,types,years_active FROM collaborations LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const collab::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if COLLAB_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    COLLAB_LOG_INFO("using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if COLLAB_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    COLLAB_LOG_INFO("using postgres repository", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  COLLAB_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const collab::runtime::config::RuntimeConfig& config, bool start_maintenance) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config.database());

  // ------------------------------------------------------------------
  // Population
  // ------------------------------------------------------------------
  app.apply_pool = std::make_shared<population::ApplyWorkerPool>(config.population().workers());
  app.apply_pool->Start();

  graph::AggregateStoreOptions store_options;
  store_options.max_transient_retries = config.population().max_transient_retries();

  auto store = std::make_shared<graph::AggregateStore>(app.repository, graph::EdgeBuilder(graph::EdgePolicy::FromConfig(config.edge_policy())),
                                                       store_options, app.apply_pool);

  // ------------------------------------------------------------------
  // Queries
  // ------------------------------------------------------------------
  app.cache_writer = std::make_shared<graph::PathCacheWriter>(app.repository);
  app.cache_writer->Start();

  graph::PathFinderOptions path_options;
  path_options.cache_ttl = ToMillis(config.path_finder().cache_ttl());
  auto path_finder       = std::make_shared<graph::PathFinder>(app.repository, app.cache_writer, path_options);

  graph::TrendEngineOptions trend_options;
  trend_options.window_years          = config.trends().window_years();
  trend_options.max_transient_retries = config.population().max_transient_retries();
  auto trends                         = std::make_shared<graph::TrendEngine>(app.repository, trend_options);

  core::CollaborationGraphOptions graph_options;
  graph_options.default_max_depth     = config.path_finder().default_max_depth();
  graph_options.max_transient_retries = config.population().max_transient_retries();
  app.graph = std::make_shared<core::CollaborationGraph>(app.repository, store, path_finder, trends, graph_options);

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------
  runtime::MaintenanceOptions maintenance_options;
  maintenance_options.interval  = ToMillis(config.trends().refresh_interval());
  maintenance_options.cache_ttl = path_options.cache_ttl;
  app.maintenance               = std::make_shared<runtime::MaintenanceWorker>(app.repository, trends, maintenance_options);
  if (start_maintenance) {
    app.maintenance->Start();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.graph         = app.graph;
  app.graph_service = std::make_shared<service::GraphService>(ctx);

  return app;
}

void Application::Shutdown() {
  if (maintenance) maintenance->Stop();
  if (apply_pool) apply_pool->Stop();
  if (cache_writer) cache_writer->Stop();
}

} // namespace collab::factory
