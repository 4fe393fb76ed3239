#include "migrations.hpp"

#include <stdexcept>

#include "internal/db/sql/query_catalog.hpp"
#include "internal/observability/logging.hpp"

namespace ledger::db::sql {

void RunMigrations(MigrationExecutor& executor, const QueryCatalog& catalog) {
  std::size_t applied = 0;
  for (const auto& statement : catalog.Schema()) {
    try {
      executor.ExecuteSQL(statement);
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string(DialectName(catalog.dialect())) + " migration " + std::to_string(applied) +
                               " failed: " + e.what());
    }
    ++applied;
  }
  LEDGER_LOG_INFO("Schema migrations applied",
                  {ledger::observability::StringField("dialect", DialectName(catalog.dialect())),
                   ledger::observability::IntField("statements", static_cast<std::int64_t>(applied))});
}

} // namespace ledger::db::sql
