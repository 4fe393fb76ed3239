#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ledger::db::sql {

enum class Dialect {
  kSqlite,
  kPostgres,
};

/*
  Named query operations.

  Every data access the ledger performs has a name here. Entity code
  only ever asks a Repository for an operation; SQL backends turn the
  operation into text through the QueryCatalog of their dialect.
*/
enum class Operation : std::size_t {
  kInsertAlgorithm,
  kGetAlgorithmByKey,
  kGetAlgorithm,

  kInsertFile,
  kGetFileById,
  kGetFileByLfn,
  kDeleteFile,
  kDeleteFileLineage,
  kCountFiles,

  kAddChecksum,
  kGetChecksums,
  kAddRun,
  kAddLumi,
  kGetRuns,

  kAddLocation,
  kAddFileLocation,
  kGetLocations,

  kAddLineage,
  kGetParents,
  kGetChildren,
  kGetParentStatus,

  kSetBlockStatus,
  kGetBlockStatus,
  kAddBlockLocation,
  kGetBlockLocations,
  kSetBlock,
  kGetBlock,
  kGetBlockFiles,

  kFindUploadableDatasets,
  kFindUploadableFiles,
  kFindAlgos,
  kUpdateFilesStatus,

  kCount_
};

inline constexpr std::size_t kOperationCount = static_cast<std::size_t>(Operation::kCount_);

std::string_view OperationName(Operation op);
std::optional<Operation> OperationFromName(std::string_view name);

std::string_view DialectName(Dialect dialect);

/*
  Static registry of query text per dialect.

  Built once per process on first use and never mutated afterwards, so
  it can be shared by every transaction and thread. Queries are written
  once in the SQLite-compatible subset with ? placeholders; the Postgres
  catalog rewrites them to $n and overrides the few statements whose
  syntax differs (DDL, id generation).
*/
class QueryCatalog {
 public:
  static const QueryCatalog& ForDialect(Dialect dialect);

  Dialect dialect() const {
    return dialect_;
  }

  const std::string& Get(Operation op) const;

  // Throws util::NotFoundError for a name that is not registered.
  const std::string& Get(std::string_view name) const;

  // CREATE statements in dependency order.
  const std::vector<std::string>& Schema() const {
    return schema_;
  }

 private:
  explicit QueryCatalog(Dialect dialect);

  void Register(Operation op, std::string sql);

  Dialect                                   dialect_;
  std::array<std::string, kOperationCount> queries_;
  std::vector<std::string>                  schema_;
};

// Rewrites ? placeholders to $1..$n, leaving quoted literals alone.
std::string ToPositional(std::string_view sql);

} // namespace ledger::db::sql
