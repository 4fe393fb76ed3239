#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const std::runtime_error& e) {
    throw ledger::util::TransientStoreError(std::string("sqlite begin: ") + e.what());
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      LEDGER_LOG_WARN("SQLite rollback on destruction failed", {ledger::observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const std::runtime_error& e) {
    throw ledger::util::TransientStoreError(std::string("sqlite commit: ") + e.what());
  }
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  committed_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace ledger::db::sqlite
