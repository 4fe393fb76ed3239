#pragma once

#include <functional>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/query_catalog.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ledger::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertAlgorithm(Transaction&, model::AlgorithmRow&) override;
  std::optional<model::AlgorithmRow> GetAlgorithm(Transaction&, uint64_t id) override;

  Result InsertFile(Transaction&, model::FileRow&) override;
  std::optional<model::FileRow> GetFileById(Transaction&, uint64_t id) override;
  std::optional<model::FileRow> GetFileByLfn(Transaction&, const std::string& lfn) override;
  Result DeleteFile(Transaction&, uint64_t id) override;
  uint64_t CountFiles(Transaction&) override;

  Result AddChecksums(Transaction&, uint64_t file_id, const ledger::model::Checksums&) override;
  ledger::model::Checksums GetChecksums(Transaction&, uint64_t file_id) override;
  Result AddRuns(Transaction&, uint64_t file_id, const ledger::model::RunSet&) override;
  ledger::model::RunSet GetRuns(Transaction&, uint64_t file_id) override;

  Result AddLocation(Transaction&, const std::string& site) override;
  Result AddFileLocation(Transaction&, uint64_t file_id, const std::string& site) override;
  ledger::model::SiteSet GetLocations(Transaction&, uint64_t file_id) override;

  Result AddLineage(Transaction&, const model::LineageRow&) override;
  std::vector<std::string> GetParents(Transaction&, const std::string& child_lfn) override;
  std::vector<std::string> GetChildren(Transaction&, const std::string& parent_lfn) override;
  std::vector<ledger::model::FileStatus> GetParentStatus(Transaction&, const std::string& child_lfn) override;

  Result SetBlockStatus(Transaction&, const std::string& block, ledger::model::BlockStatus) override;
  Result AddBlockLocation(Transaction&, const std::string& block, const std::string& site) override;
  std::optional<model::BlockRow> GetBlockInfo(Transaction&, const std::string& block) override;
  Result SetBlock(Transaction&, const std::string& lfn, const std::string& block) override;
  std::optional<std::string> GetBlock(Transaction&, const std::string& lfn) override;
  std::vector<std::string> GetBlockFiles(Transaction&, const std::string& block) override;

  std::vector<std::string> FindUploadableDatasets(Transaction&) override;
  std::vector<model::FileRow> FindUploadableFiles(Transaction&, const std::string& dataset_path,
                                                  std::size_t max_files) override;
  std::vector<model::AlgorithmRow> FindAlgos(Transaction&, const std::string& dataset_path) override;
  Result UpdateFileStatus(Transaction&, uint64_t file_id, ledger::model::FileStatus) override;

private:
  using RowFn = std::function<void(sqlite3_stmt*)>;

  // Runs a write statement; *changes receives the affected row count.
  Result Exec(Transaction& t, sql::Operation op, const sql::Params& params, int* changes = nullptr);

  // Runs a read statement, calling on_row for every result row.
  Result Query(Transaction& t, sql::Operation op, const sql::Params& params, const RowFn& on_row);

  std::shared_ptr<SqliteDB> db_;
  const sql::QueryCatalog&  catalog_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
