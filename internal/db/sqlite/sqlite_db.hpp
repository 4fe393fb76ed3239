#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace ledger::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One handle is shared by every transaction of a repository; SQLite
  allows a single open transaction per connection.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Configure PRAGMAs (WAL, foreign keys, etc.)
  void Configure(int busy_timeout_ms);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace ledger::db::sqlite
