#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/query_catalog.hpp"
#include "internal/observability/logging.hpp"
#if LEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if LEDGER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace ledger::factory {

namespace {

constexpr int         kDefaultBusyTimeoutMs   = 5000;
constexpr std::size_t kDefaultMaxConnections  = 16;
constexpr std::size_t kDefaultMaxFilesPerQuery = 10;

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const ledger::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LEDGER_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    const int busy_timeout = sqlite.busy_timeout_ms() ? static_cast<int>(sqlite.busy_timeout_ms()) : kDefaultBusyTimeoutMs;

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), busy_timeout);
    db::sql::RunMigrations(*sqlite_db, db::sql::QueryCatalog::ForDialect(db::sql::Dialect::kSqlite));
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if LEDGER_DB_POSTGRES
    const auto& postgres = database.postgres();
    const std::size_t max_connections =
        postgres.max_connections() ? static_cast<std::size_t>(postgres.max_connections()) : kDefaultMaxConnections;

    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
    db::postgres::PgMigrationExecutor executor(pool->Conninfo());
    db::sql::RunMigrations(executor, db::sql::QueryCatalog::ForDialect(db::sql::Dialect::kPostgres));
    LEDGER_LOG_INFO("Postgres repository ready", {ledger::observability::IntField("max_connections", static_cast<int64_t>(max_connections))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  LEDGER_LOG_INFO("Memory repository ready; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const ledger::runtime::config::RuntimeConfig& config) {
  Application app;
  app.repository = BuildRepository(config);

  const std::size_t max_files = config.upload().max_files_per_query()
                                    ? static_cast<std::size_t>(config.upload().max_files_per_query())
                                    : kDefaultMaxFilesPerQuery;
  app.upload_service = std::make_shared<service::UploadService>(app.repository, max_files);
  return app;
}

} // namespace ledger::factory
