#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace ledger::db::sqlite {

/*
  One ledger transaction on the shared SqliteDB handle.

  BEGIN IMMEDIATE takes the write lock up front. When another process
  holds it, the constructor waits out the busy timeout and then throws
  util::TransientStoreError, before Create() or UpdateFilesStatus() has
  written anything. A second Begin() on the same handle while one is
  open throws the same error right away.

  A failed statement leaves the transaction usable; the caller still
  chooses Commit() or Rollback(). Destruction without either rolls back.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  // Statements of this transaction run on this handle.
  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
};

} // namespace ledger::db::sqlite
