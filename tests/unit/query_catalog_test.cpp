#include "internal/db/sql/query_catalog.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"

namespace {

using ledger::db::sql::Dialect;
using ledger::db::sql::Operation;
using ledger::db::sql::QueryCatalog;

void TestEveryOperationHasTextInBothDialects() {
  for (auto dialect : {Dialect::kSqlite, Dialect::kPostgres}) {
    const auto& catalog = QueryCatalog::ForDialect(dialect);
    assert(catalog.dialect() == dialect);
    for (std::size_t i = 0; i < ledger::db::sql::kOperationCount; ++i) {
      const auto op = static_cast<Operation>(i);
      assert(!catalog.Get(op).empty());
      assert(&catalog.Get(ledger::db::sql::OperationName(op)) == &catalog.Get(op));
    }
    assert(!catalog.Schema().empty());
  }
}

void TestCatalogIsSharedPerDialect() {
  assert(&QueryCatalog::ForDialect(Dialect::kSqlite) == &QueryCatalog::ForDialect(Dialect::kSqlite));
  assert(&QueryCatalog::ForDialect(Dialect::kSqlite) != &QueryCatalog::ForDialect(Dialect::kPostgres));
}

void TestOperationNamesResolve() {
  assert(ledger::db::sql::OperationFromName("FindUploadableFiles") == Operation::kFindUploadableFiles);
  assert(ledger::db::sql::OperationName(Operation::kGetParentStatus) == "GetParentStatus");
  assert(!ledger::db::sql::OperationFromName("DropEverything").has_value());
}

void TestUnknownNameIsNotFound() {
  bool threw = false;
  try {
    (void)QueryCatalog::ForDialect(Dialect::kSqlite).Get("NoSuchQuery");
  } catch (const ledger::util::NotFoundError&) {
    threw = true;
  }
  assert(threw);
}

void TestPostgresUsesPositionalPlaceholders() {
  const auto& pg = QueryCatalog::ForDialect(Dialect::kPostgres);
  const auto& sql = pg.Get(Operation::kFindUploadableFiles);
  assert(sql.find('?') == std::string::npos);
  assert(sql.find("$1") != std::string::npos);
  assert(sql.find("$2") != std::string::npos);
  // status literals stay untouched
  assert(sql.find("'NOTUPLOADED'") != std::string::npos);

  assert(pg.Get(Operation::kInsertFile).find("RETURNING id") != std::string::npos);
  assert(QueryCatalog::ForDialect(Dialect::kSqlite).Get(Operation::kInsertFile).find("RETURNING") == std::string::npos);
}

void TestToPositionalSkipsQuotedText() {
  assert(ledger::db::sql::ToPositional("SELECT ? , '?' , ?") == "SELECT $1 , '?' , $2");
  assert(ledger::db::sql::ToPositional("SELECT 1") == "SELECT 1");
}

class RecordingExecutor final : public ledger::db::sql::MigrationExecutor {
 public:
  explicit RecordingExecutor(std::size_t fail_at = SIZE_MAX) : fail_at_(fail_at) {
  }

  void ExecuteSQL(const std::string& sql) override {
    if (statements.size() == fail_at_) {
      throw std::runtime_error("disk full");
    }
    statements.push_back(sql);
  }

  std::vector<std::string> statements;

 private:
  std::size_t fail_at_;
};

void TestMigrationsApplySchemaInOrder() {
  const auto&       catalog = QueryCatalog::ForDialect(Dialect::kSqlite);
  RecordingExecutor executor;
  ledger::db::sql::RunMigrations(executor, catalog);
  assert(executor.statements == catalog.Schema());
}

void TestFailedMigrationNamesStatement() {
  RecordingExecutor executor(1);
  std::string       message;
  try {
    ledger::db::sql::RunMigrations(executor, QueryCatalog::ForDialect(Dialect::kPostgres));
  } catch (const std::runtime_error& e) {
    message = e.what();
  }
  assert(message == "postgres migration 1 failed: disk full");
  assert(executor.statements.size() == 1);
}

} // namespace

int main() {
  TestEveryOperationHasTextInBothDialects();
  TestCatalogIsSharedPerDialect();
  TestOperationNamesResolve();
  TestUnknownNameIsNotFound();
  TestPostgresUsesPositionalPlaceholders();
  TestToPositionalSkipsQuotedText();
  TestMigrationsApplySchemaInOrder();
  TestFailedMigrationNamesStatement();

  std::cout << "ledger_unit_query_catalog: pass\n";
  return 0;
}
