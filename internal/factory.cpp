#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#if APPARATUS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if APPARATUS_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace apparatus::factory {

namespace {

#if APPARATUS_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

// Runs on a dedicated connection: pooled connections prepare statements
// against these tables as soon as they open.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection    conn(connection_uri);
  pqxx::work          tx(conn);
  PgMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());
  tx.commit();
}
#endif

model::Significance ResolveGateThreshold(const apparatus::runtime::config::RuntimeConfig& config) {
  const auto& configured = config.gate().minimum_significance();
  if (configured.empty()) {
    return model::Significance::kSignificant;
  }
  auto parsed = model::ParseSignificance(configured);
  if (!parsed) {
    throw std::runtime_error("gate.minimum_significance must be minor, significant or major, got \"" + configured + "\"");
  }
  return *parsed;
}

} // namespace

void InitializeObservability(const apparatus::runtime::config::RuntimeConfig& config) {
  observability::InitializeLogging(config);
  const bool tracing = observability::InitializeTracing(config);
  const bool metrics = observability::InitializeMetrics(config);
  APPARATUS_LOG_INFO("observability ready", {observability::BoolField("tracing", tracing), observability::BoolField("metrics", metrics)});
}

void ShutdownObservability() {
  observability::ShutdownMetrics();
  observability::ShutdownTracing();
  observability::ShutdownLogging();
}

std::shared_ptr<db::Repository> BuildRepository(const apparatus::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if APPARATUS_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    // builds and sessions use separate connections to one file
    if (sqlite.path() == ":memory:") {
      throw std::runtime_error("database.sqlite.path must name a file; use the memory backend instead of :memory:");
    }
    auto repository = db::sqlite::SqliteRepository::Open(sqlite.path(), sqlite.busy_timeout_ms() > 0 ? sqlite.busy_timeout_ms() : 5000);
    APPARATUS_LOG_INFO("sqlite backend ready", {observability::StringField("path", sqlite.path()),
                                                observability::StringField("gate", db::sqlite::SqliteRepository::GatePath(sqlite.path()))});
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if APPARATUS_DB_POSTGRES
    const auto& postgres = database.postgres();
    BootstrapPostgresSchema(postgres.connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections() > 0 ? postgres.max_connections() : 16);
    APPARATUS_LOG_INFO("postgres backend ready");
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
Application Build(const apparatus::runtime::config::RuntimeConfig& config, std::shared_ptr<pack::PackLoader> packs,
                  std::shared_ptr<pack::SpineSource> spine) {
  Application app;

  app.repository = BuildRepository(config);
  app.store      = std::make_shared<store::VariantStore>(app.repository);

  core::AggregationEngine::Options engine_options;
  if (config.aggregation().worker_threads() > 0) {
    engine_options.worker_threads = config.aggregation().worker_threads();
  }
  app.engine = std::make_shared<core::AggregationEngine>(app.store, std::move(packs), std::move(spine), engine_options);

  gate::GateResolver::Options gate_options;
  gate_options.minimum_significance = ResolveGateThreshold(config);
  app.gate = std::make_shared<gate::GateResolver>(app.store, gate_options);

  return app;
}

} // namespace apparatus::factory
