#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace ledger::db::postgres {

/*
  PgPool

  Connection pool used by PgRepository.

  - Each transaction holds its own connection until it ends.
  - libpqxx connections are NOT thread-safe; never share one.
  - Every query of the postgres QueryCatalog is prepared on each new
    connection under its operation name.
  - Acquire() blocks while max_connections are in use.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Acquire a ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

  const std::string& Conninfo() const {
    return conninfo_;
  }

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

/*
  Runs schema statements on a dedicated connection, one short-lived
  transaction per statement. Pool connections cannot be used before
  the schema exists: they prepare every catalog query on open.
*/
class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(const std::string& conninfo);

  void ExecuteSQL(const std::string& sql) override;

 private:
  pqxx::connection conn_;
};

} // namespace ledger::db::postgres
