#include "pg_repository.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::db::postgres {

using sql::Operation;

namespace {

pqxx::params ToPqxx(const sql::Params& params) {
  pqxx::params out;
  for (const auto& param : params) {
    std::visit([&](const auto& v) {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, std::nullptr_t>) {
        out.append();
      } else if constexpr (std::is_same_v<T, uint64_t>) {
        // BIGINT columns; also keeps an unbounded LIMIT non-negative
        out.append(static_cast<int64_t>(std::min<uint64_t>(v, std::numeric_limits<int64_t>::max())));
      } else {
        out.append(v);
      }
    }, param);
  }
  return out;
}

std::string Text(ledger::model::FileStatus status) {
  return std::string(ledger::model::ToString(status));
}

std::string Text(ledger::model::BlockStatus status) {
  return std::string(ledger::model::ToString(status));
}

std::string FieldText(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

ledger::model::FileStatus FieldFileStatus(const pqxx::field& f) {
  auto text   = FieldText(f);
  auto status = ledger::model::ParseFileStatus(text);
  if (!status) throw std::runtime_error("postgres: unknown file status '" + text + "'");
  return *status;
}

model::FileRow ReadFile(const pqxx::row& row) {
  model::FileRow r;
  r.id            = row[0].as<uint64_t>();
  r.lfn           = FieldText(row[1]);
  r.size_bytes    = row[2].as<uint64_t>();
  r.events        = row[3].as<uint64_t>();
  r.dataset_path  = FieldText(row[4]);
  r.algorithm_id  = row[5].as<uint64_t>();
  r.status        = FieldFileStatus(row[6]);
  r.block_name    = FieldText(row[7]);
  r.created_at_ms = row[8].as<uint64_t>();
  return r;
}

model::AlgorithmRow ReadAlgorithm(const pqxx::row& row) {
  model::AlgorithmRow r;
  r.id                       = row[0].as<uint64_t>();
  r.algorithm.app_name       = FieldText(row[1]);
  r.algorithm.app_version    = FieldText(row[2]);
  r.algorithm.app_family     = FieldText(row[3]);
  r.algorithm.pset_hash      = FieldText(row[4]);
  r.algorithm.config_content = FieldText(row[5]);
  return r;
}

std::vector<std::string> FirstColumn(const pqxx::result& res) {
  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(FieldText(row[0]));
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::Exec(Transaction& t, Operation op, const sql::Params& params, pqxx::result* out) {
  auto&      tx   = TX(t);
  const auto name = std::string(sql::OperationName(op));
  if (tx.aborted()) {
    return Result::Err(ErrorCode::Conflict, name + " refused: transaction aborted by failed " + tx.aborted_by());
  }
  try {
    auto res = tx.Work().exec_prepared(name, ToPqxx(params));
    if (out) *out = std::move(res);
    return Result::Ok();
  } catch (const std::exception& e) {
    tx.MarkAborted(name);
    return Translate(e);
  }
}

pqxx::result PgRepository::Read(Transaction& t, Operation op, const sql::Params& params) {
  pqxx::result res;
  ledger::util::ThrowIfDbError(Exec(t, op, params, &res), std::string(sql::OperationName(op)));
  return res;
}

// ---------------------------------------------------------------------
// Algorithms
// ---------------------------------------------------------------------

Result PgRepository::UpsertAlgorithm(Transaction& t, model::AlgorithmRow& row) {
  const auto& a = row.algorithm;
  auto res = Exec(t, Operation::kInsertAlgorithm, {a.app_name, a.app_version, a.app_family, a.pset_hash, a.config_content});
  if (!res) return res;

  pqxx::result rows;
  res = Exec(t, Operation::kGetAlgorithmByKey, {a.app_name, a.app_version, a.app_family, a.pset_hash}, &rows);
  if (!res) return res;
  if (rows.empty()) return Result::Err(ErrorCode::InternalError, "algorithm vanished after insert");

  row.id = rows[0][0].as<uint64_t>();
  return Result::Ok();
}

std::optional<model::AlgorithmRow> PgRepository::GetAlgorithm(Transaction& t, uint64_t id) {
  auto res = Read(t, Operation::kGetAlgorithm, {id});
  if (res.empty()) return std::nullopt;
  return ReadAlgorithm(res[0]);
}

// ---------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------

Result PgRepository::InsertFile(Transaction& t, model::FileRow& row) {
  if (row.created_at_ms == 0) row.created_at_ms = ledger::util::NowMillis();

  pqxx::result rows;
  auto res = Exec(t, Operation::kInsertFile,
                  {row.lfn, row.size_bytes, row.events, row.dataset_path, row.algorithm_id, Text(row.status),
                   row.block_name, row.created_at_ms},
                  &rows);
  if (!res) return res;

  // RETURNING id
  row.id = rows[0][0].as<uint64_t>();
  return Result::Ok();
}

std::optional<model::FileRow> PgRepository::GetFileById(Transaction& t, uint64_t id) {
  auto res = Read(t, Operation::kGetFileById, {id});
  if (res.empty()) return std::nullopt;
  return ReadFile(res[0]);
}

std::optional<model::FileRow> PgRepository::GetFileByLfn(Transaction& t, const std::string& lfn) {
  auto res = Read(t, Operation::kGetFileByLfn, {lfn});
  if (res.empty()) return std::nullopt;
  return ReadFile(res[0]);
}

Result PgRepository::DeleteFile(Transaction& t, uint64_t id) {
  auto res = Exec(t, Operation::kDeleteFileLineage, {id});
  if (!res) return res;

  pqxx::result rows;
  res = Exec(t, Operation::kDeleteFile, {id}, &rows);
  if (!res) return res;
  if (rows.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "file id " + std::to_string(id));
  return Result::Ok();
}

uint64_t PgRepository::CountFiles(Transaction& t) {
  return Read(t, Operation::kCountFiles, {})[0][0].as<uint64_t>();
}

Result PgRepository::AddChecksums(Transaction& t, uint64_t file_id, const ledger::model::Checksums& checksums) {
  for (const auto& [algorithm, digest] : checksums) {
    auto res = Exec(t, Operation::kAddChecksum, {file_id, algorithm, digest});
    if (!res) return res;
  }
  return Result::Ok();
}

ledger::model::Checksums PgRepository::GetChecksums(Transaction& t, uint64_t file_id) {
  ledger::model::Checksums out;
  for (const auto& row : Read(t, Operation::kGetChecksums, {file_id})) {
    out[FieldText(row[0])] = FieldText(row[1]);
  }
  return out;
}

Result PgRepository::AddRuns(Transaction& t, uint64_t file_id, const ledger::model::RunSet& runs) {
  for (const auto& [run, lumis] : runs) {
    auto res = Exec(t, Operation::kAddRun, {file_id, static_cast<uint64_t>(run)});
    if (!res) return res;
    for (auto lumi : lumis) {
      res = Exec(t, Operation::kAddLumi, {file_id, static_cast<uint64_t>(run), static_cast<uint64_t>(lumi)});
      if (!res) return res;
    }
  }
  return Result::Ok();
}

ledger::model::RunSet PgRepository::GetRuns(Transaction& t, uint64_t file_id) {
  std::map<ledger::model::RunNumber, std::set<ledger::model::LumiNumber>> runs;
  for (const auto& row : Read(t, Operation::kGetRuns, {file_id})) {
    auto& lumis = runs[row[0].as<ledger::model::RunNumber>()];
    if (!row[1].is_null()) lumis.insert(row[1].as<ledger::model::LumiNumber>());
  }

  ledger::model::RunSet out;
  for (auto& [run, lumis] : runs) out.Add(ledger::model::Run(run, std::move(lumis)));
  return out;
}

// ---------------------------------------------------------------------
// Locations
// ---------------------------------------------------------------------

Result PgRepository::AddLocation(Transaction& t, const std::string& site) {
  return Exec(t, Operation::kAddLocation, {site});
}

Result PgRepository::AddFileLocation(Transaction& t, uint64_t file_id, const std::string& site) {
  auto res = AddLocation(t, site);
  if (!res) return res;
  return Exec(t, Operation::kAddFileLocation, {file_id, site});
}

ledger::model::SiteSet PgRepository::GetLocations(Transaction& t, uint64_t file_id) {
  auto sites = FirstColumn(Read(t, Operation::kGetLocations, {file_id}));
  return {sites.begin(), sites.end()};
}

// ---------------------------------------------------------------------
// Lineage
// ---------------------------------------------------------------------

Result PgRepository::AddLineage(Transaction& t, const model::LineageRow& edge) {
  const uint64_t ts = edge.created_at_ms ? edge.created_at_ms : ledger::util::NowMillis();
  return Exec(t, Operation::kAddLineage, {edge.parent_lfn, edge.child_lfn, ts});
}

std::vector<std::string> PgRepository::GetParents(Transaction& t, const std::string& child_lfn) {
  return FirstColumn(Read(t, Operation::kGetParents, {child_lfn}));
}

std::vector<std::string> PgRepository::GetChildren(Transaction& t, const std::string& parent_lfn) {
  return FirstColumn(Read(t, Operation::kGetChildren, {parent_lfn}));
}

std::vector<ledger::model::FileStatus> PgRepository::GetParentStatus(Transaction& t, const std::string& child_lfn) {
  std::vector<ledger::model::FileStatus> out;
  for (const auto& row : Read(t, Operation::kGetParentStatus, {child_lfn})) {
    out.push_back(FieldFileStatus(row[0]));
  }
  return out;
}

// ---------------------------------------------------------------------
// Blocks
// ---------------------------------------------------------------------

Result PgRepository::SetBlockStatus(Transaction& t, const std::string& block, ledger::model::BlockStatus status) {
  return Exec(t, Operation::kSetBlockStatus, {block, Text(status), ledger::util::NowMillis()});
}

Result PgRepository::AddBlockLocation(Transaction& t, const std::string& block, const std::string& site) {
  auto res = AddLocation(t, site);
  if (!res) return res;
  return Exec(t, Operation::kAddBlockLocation, {block, site});
}

std::optional<model::BlockRow> PgRepository::GetBlockInfo(Transaction& t, const std::string& block) {
  auto res = Read(t, Operation::kGetBlockStatus, {block});
  if (res.empty()) return std::nullopt;

  model::BlockRow row;
  row.name = FieldText(res[0][0]);
  auto status = ledger::model::ParseBlockStatus(FieldText(res[0][1]));
  if (!status) throw std::runtime_error("postgres: unknown block status '" + FieldText(res[0][1]) + "'");
  row.status        = *status;
  row.created_at_ms = res[0][2].as<uint64_t>();

  for (auto& site : FirstColumn(Read(t, Operation::kGetBlockLocations, {block}))) {
    row.locations.insert(std::move(site));
  }
  return row;
}

Result PgRepository::SetBlock(Transaction& t, const std::string& lfn, const std::string& block) {
  pqxx::result rows;
  auto res = Exec(t, Operation::kSetBlock, {block, lfn}, &rows);
  if (!res) return res;
  if (rows.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "lfn " + lfn);
  return Result::Ok();
}

std::optional<std::string> PgRepository::GetBlock(Transaction& t, const std::string& lfn) {
  auto res = Read(t, Operation::kGetBlock, {lfn});
  if (res.empty()) return std::nullopt;
  auto block = FieldText(res[0][0]);
  if (block.empty()) return std::nullopt;
  return block;
}

std::vector<std::string> PgRepository::GetBlockFiles(Transaction& t, const std::string& block) {
  return FirstColumn(Read(t, Operation::kGetBlockFiles, {block}));
}

// ---------------------------------------------------------------------
// Upload discovery
// ---------------------------------------------------------------------

std::vector<std::string> PgRepository::FindUploadableDatasets(Transaction& t) {
  return FirstColumn(Read(t, Operation::kFindUploadableDatasets, {}));
}

std::vector<model::FileRow> PgRepository::FindUploadableFiles(Transaction& t, const std::string& dataset_path,
                                                              std::size_t max_files) {
  std::vector<model::FileRow> out;
  for (const auto& row : Read(t, Operation::kFindUploadableFiles, {dataset_path, static_cast<uint64_t>(max_files)})) {
    out.push_back(ReadFile(row));
  }
  return out;
}

std::vector<model::AlgorithmRow> PgRepository::FindAlgos(Transaction& t, const std::string& dataset_path) {
  std::vector<model::AlgorithmRow> out;
  for (const auto& row : Read(t, Operation::kFindAlgos, {dataset_path})) {
    out.push_back(ReadAlgorithm(row));
  }
  return out;
}

Result PgRepository::UpdateFileStatus(Transaction& t, uint64_t file_id, ledger::model::FileStatus status) {
  pqxx::result rows;
  auto res = Exec(t, Operation::kUpdateFilesStatus, {Text(status), file_id}, &rows);
  if (!res) return res;
  if (rows.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "file id " + std::to_string(file_id));
  return Result::Ok();
}

} // namespace ledger::db::postgres
