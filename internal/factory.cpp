#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/block_manager.hpp"
#include "internal/core/healing_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/executor/sandboxed_executor.hpp"
#include "internal/grpc/block_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/oracle/openai_oracle.hpp"
#include "internal/service/block_service.hpp"
#include "internal/service/service_context.hpp"
#if BLOCKFORGE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if BLOCKFORGE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace blockforge::factory {

using namespace blockforge;

std::shared_ptr<db::Repository> BuildRepository(const blockforge::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if BLOCKFORGE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    BLOCKFORGE_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if BLOCKFORGE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::BootstrapSchema(pool);
    BLOCKFORGE_LOG_INFO("Using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  BLOCKFORGE_LOG_WARN("No database configured, block state is kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const blockforge::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  auto oracle   = std::make_shared<oracle::OpenAiOracle>(oracle::OpenAiOracleOptions::FromConfig(config.oracle()));
  auto executor = std::make_shared<executor::SandboxedExecutor>(executor::SandboxedExecutorOptions::FromConfig(config.executor()));

  // ------------------------------------------------------------------
  // Lifecycle
  // ------------------------------------------------------------------
  core::BlockManagerOptions options;
  options.default_refresh_interval_sec = config.lifecycle().default_refresh_interval_sec();
  options.heal_policy                  = core::HealPolicy::FromConfig(config.lifecycle());

  app.manager = std::make_shared<core::BlockManager>(app.repository, std::move(oracle), std::move(executor), std::move(options));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager = app.manager;

  app.block_service = std::make_shared<service::BlockService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::BlockServer>(app.block_service));

  return app;
}

} // namespace blockforge::factory
