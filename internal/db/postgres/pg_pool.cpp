#include "pg_pool.hpp"

#include "internal/db/sql/query_catalog.hpp"

namespace ledger::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        if (conn->is_open()) {
          return Wrap(conn.release());
        }
        // dropped by the server; open a replacement below
        --live_connections_;
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        std::unique_ptr<pqxx::connection> conn;
        try {
          conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
        return Wrap(conn.release());
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const auto& catalog = sql::QueryCatalog::ForDialect(sql::Dialect::kPostgres);
  for (std::size_t i = 0; i < sql::kOperationCount; ++i) {
    const auto op = static_cast<sql::Operation>(i);
    conn.prepare(std::string(sql::OperationName(op)), catalog.Get(op));
  }
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

PgMigrationExecutor::PgMigrationExecutor(const std::string& conninfo) : conn_(conninfo) {
}

void PgMigrationExecutor::ExecuteSQL(const std::string& sql) {
  pqxx::work tx(conn_);
  tx.exec(sql);
  tx.commit();
}

} // namespace ledger::db::postgres
