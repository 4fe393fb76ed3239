#include "pg_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  try {
    conn_ = pool->Acquire();
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::broken_connection& e) {
    throw ledger::util::TransientStoreError(std::string("postgres begin: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (!committed_ && tx_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      LEDGER_LOG_WARN("Postgres rollback on destruction failed", {ledger::observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::MarkAborted(std::string_view operation) {
  if (aborted_by_.empty()) {
    aborted_by_ = std::string(operation);
  }
}

void PgTransaction::Commit() {
  if (aborted()) {
    tx_->abort();
    committed_ = true;
    throw ledger::util::TransientStoreError("postgres commit: transaction aborted by failed " + aborted_by_);
  }
  try {
    tx_->commit();
  } catch (const pqxx::transaction_rollback& e) {
    committed_ = true;
    throw ledger::util::TransientStoreError(std::string("postgres commit: ") + e.what());
  } catch (const pqxx::broken_connection& e) {
    committed_ = true;
    throw ledger::util::TransientStoreError(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  committed_ = true;
}

}
