#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/audit/audit_reader.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/settlement_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/settlement_service.hpp"
#if SETTLE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SETTLE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace settle::factory {

namespace {

#if SETTLE_DB_POSTGRES
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

void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  PgMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const settle::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if SETTLE_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is empty");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    SETTLE_LOG_INFO("database ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SETTLE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    SETTLE_LOG_INFO("database ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SETTLE_LOG_WARN("using in-memory database; nothing survives a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const settle::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage and core components
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config.database());
  app.engine     = std::make_shared<core::SettlementEngine>(app.repository);
  auto audit     = std::make_shared<audit::AuditReader>(app.repository);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine     = app.engine;
  ctx.audit      = audit;
  ctx.repository = app.repository;
  ctx.settlement = config.settlement();

  app.settlement_service = std::make_shared<service::SettlementService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::SettlementServer>(app.settlement_service));

  return app;
}

} // namespace settle::factory
