#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <string_view>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace ledger::db::postgres {

/*
  One ledger transaction on a pooled connection.

  Postgres aborts the whole transaction when a statement fails. The
  first failing catalog operation is remembered; later statements are
  refused without a round trip and Commit() throws
  util::TransientStoreError. Rollback() is always allowed.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void MarkAborted(std::string_view operation);
  bool aborted() const { return !aborted_by_.empty(); }
  const std::string& aborted_by() const { return aborted_by_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  std::string aborted_by_;
  bool committed_ = false;
};

} // namespace ledger::db::postgres
