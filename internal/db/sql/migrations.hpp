#pragma once

#include <string>

namespace ledger::db::sql {

class QueryCatalog;

/*
  Sink for schema statements. SqliteDB executes them on its own
  handle; postgres uses a dedicated PgMigrationExecutor connection.
*/
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Applies the catalog's schema statements in order. Every statement is
// idempotent (IF NOT EXISTS), so reopening an existing ledger is safe.
// Throws std::runtime_error naming the failing statement index.
void RunMigrations(MigrationExecutor& executor, const QueryCatalog& catalog);

} // namespace ledger::db::sql
