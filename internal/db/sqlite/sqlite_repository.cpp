#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <type_traits>
#include <variant>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::db::sqlite {

using ledger::db::ErrorCode;
using ledger::db::Result;
using sql::Operation;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

int BindParams(sqlite3_stmt* st, const sql::Params& params) {
    int idx = 1;
    for (const auto& param : params) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                sqlite3_bind_null(st, idx);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                sqlite3_bind_int64(st, idx, v);
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                BindU64(st, idx, v);
            } else {
                BindText(st, idx, v);
            }
        }, param);
        ++idx;
    }
    return idx - 1;
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::string Text(ledger::model::FileStatus status) {
    return std::string(ledger::model::ToString(status));
}

std::string Text(ledger::model::BlockStatus status) {
    return std::string(ledger::model::ToString(status));
}

ledger::model::FileStatus ColFileStatus(sqlite3_stmt* st, int col) {
    auto text   = ColText(st, col);
    auto status = ledger::model::ParseFileStatus(text);
    if (!status) throw std::runtime_error("sqlite: unknown file status '" + text + "'");
    return *status;
}

ledger::model::BlockStatus ColBlockStatus(sqlite3_stmt* st, int col) {
    auto text   = ColText(st, col);
    auto status = ledger::model::ParseBlockStatus(text);
    if (!status) throw std::runtime_error("sqlite: unknown block status '" + text + "'");
    return *status;
}

// Column order of every file SELECT in the catalog.
model::FileRow ReadFile(sqlite3_stmt* st) {
    model::FileRow r;
    r.id            = ColU64(st, 0);
    r.lfn           = ColText(st, 1);
    r.size_bytes    = ColU64(st, 2);
    r.events        = ColU64(st, 3);
    r.dataset_path  = ColText(st, 4);
    r.algorithm_id  = ColU64(st, 5);
    r.status        = ColFileStatus(st, 6);
    r.block_name    = ColText(st, 7);
    r.created_at_ms = ColU64(st, 8);
    return r;
}

model::AlgorithmRow ReadAlgorithm(sqlite3_stmt* st) {
    model::AlgorithmRow r;
    r.id                       = ColU64(st, 0);
    r.algorithm.app_name       = ColText(st, 1);
    r.algorithm.app_version    = ColText(st, 2);
    r.algorithm.app_family     = ColText(st, 3);
    r.algorithm.pset_hash      = ColText(st, 4);
    r.algorithm.config_content = ColText(st, 5);
    return r;
}

std::vector<std::string> ReadStrings(const Result& result, std::vector<std::string> values, const char* what) {
    ledger::util::ThrowIfDbError(result, what);
    return values;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), catalog_(sql::QueryCatalog::ForDialect(sql::Dialect::kSqlite)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (sqlite3_extended_errcode(db)) {
        case SQLITE_CONSTRAINT_UNIQUE:
        case SQLITE_CONSTRAINT_PRIMARYKEY:
            return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT_FOREIGNKEY:
            // the referenced file, block or algorithm is missing
            return Result::Err(ErrorCode::NotFound, sqlite3_errmsg(db));
        default:
            break;
    }

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::Exec(Transaction& t, Operation op, const sql::Params& params, int* changes) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db, catalog_.Get(op).c_str(), -1, &raw, nullptr);
    StmtPtr st(raw, &sqlite3_finalize);
    if (rc != SQLITE_OK) return Translate(db, rc);

    BindParams(st.get(), params);

    rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) return Translate(db, rc);

    if (changes) *changes = sqlite3_changes(db);
    return Result::Ok();
}

Result SqliteRepository::Query(Transaction& t, Operation op, const sql::Params& params, const RowFn& on_row) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db, catalog_.Get(op).c_str(), -1, &raw, nullptr);
    StmtPtr st(raw, &sqlite3_finalize);
    if (rc != SQLITE_OK) return Translate(db, rc);

    BindParams(st.get(), params);

    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        on_row(st.get());
    }
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Algorithms
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAlgorithm(Transaction& t, model::AlgorithmRow& row) {
    const auto& a = row.algorithm;
    auto res = Exec(t, Operation::kInsertAlgorithm,
                    {a.app_name, a.app_version, a.app_family, a.pset_hash, a.config_content});
    if (!res) return res;

    std::optional<uint64_t> id;
    res = Query(t, Operation::kGetAlgorithmByKey, {a.app_name, a.app_version, a.app_family, a.pset_hash},
                [&](sqlite3_stmt* st) { id = ColU64(st, 0); });
    if (!res) return res;
    if (!id) return Result::Err(ErrorCode::InternalError, "algorithm vanished after insert");

    row.id = *id;
    return Result::Ok();
}

std::optional<model::AlgorithmRow> SqliteRepository::GetAlgorithm(Transaction& t, uint64_t id) {
    std::optional<model::AlgorithmRow> out;
    auto res = Query(t, Operation::kGetAlgorithm, {id}, [&](sqlite3_stmt* st) { out = ReadAlgorithm(st); });
    ledger::util::ThrowIfDbError(res, "GetAlgorithm");
    return out;
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

Result SqliteRepository::InsertFile(Transaction& t, model::FileRow& row) {
    if (row.created_at_ms == 0) row.created_at_ms = ledger::util::NowMillis();

    auto res = Exec(t, Operation::kInsertFile,
                    {row.lfn, row.size_bytes, row.events, row.dataset_path, row.algorithm_id, Text(row.status),
                     row.block_name, row.created_at_ms});
    if (!res) return res;

    row.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(TX(t).Handle()));
    return Result::Ok();
}

std::optional<model::FileRow> SqliteRepository::GetFileById(Transaction& t, uint64_t id) {
    std::optional<model::FileRow> out;
    auto res = Query(t, Operation::kGetFileById, {id}, [&](sqlite3_stmt* st) { out = ReadFile(st); });
    ledger::util::ThrowIfDbError(res, "GetFileById");
    return out;
}

std::optional<model::FileRow> SqliteRepository::GetFileByLfn(Transaction& t, const std::string& lfn) {
    std::optional<model::FileRow> out;
    auto res = Query(t, Operation::kGetFileByLfn, {lfn}, [&](sqlite3_stmt* st) { out = ReadFile(st); });
    ledger::util::ThrowIfDbError(res, "GetFileByLfn");
    return out;
}

Result SqliteRepository::DeleteFile(Transaction& t, uint64_t id) {
    auto res = Exec(t, Operation::kDeleteFileLineage, {id});
    if (!res) return res;

    // checksum, run, lumi and location rows go with ON DELETE CASCADE
    int changes = 0;
    res = Exec(t, Operation::kDeleteFile, {id}, &changes);
    if (!res) return res;
    if (changes == 0) return Result::Err(ErrorCode::NotFound, "file id " + std::to_string(id));
    return Result::Ok();
}

uint64_t SqliteRepository::CountFiles(Transaction& t) {
    uint64_t count = 0;
    auto res = Query(t, Operation::kCountFiles, {}, [&](sqlite3_stmt* st) { count = ColU64(st, 0); });
    ledger::util::ThrowIfDbError(res, "CountFiles");
    return count;
}

Result SqliteRepository::AddChecksums(Transaction& t, uint64_t file_id, const ledger::model::Checksums& checksums) {
    for (const auto& [algorithm, digest] : checksums) {
        auto res = Exec(t, Operation::kAddChecksum, {file_id, algorithm, digest});
        if (!res) return res;
    }
    return Result::Ok();
}

ledger::model::Checksums SqliteRepository::GetChecksums(Transaction& t, uint64_t file_id) {
    ledger::model::Checksums out;
    auto res = Query(t, Operation::kGetChecksums, {file_id},
                     [&](sqlite3_stmt* st) { out[ColText(st, 0)] = ColText(st, 1); });
    ledger::util::ThrowIfDbError(res, "GetChecksums");
    return out;
}

Result SqliteRepository::AddRuns(Transaction& t, uint64_t file_id, const ledger::model::RunSet& runs) {
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

ledger::model::RunSet SqliteRepository::GetRuns(Transaction& t, uint64_t file_id) {
    std::map<ledger::model::RunNumber, std::set<ledger::model::LumiNumber>> runs;
    auto res = Query(t, Operation::kGetRuns, {file_id}, [&](sqlite3_stmt* st) {
        auto& lumis = runs[static_cast<ledger::model::RunNumber>(ColU64(st, 0))];
        if (sqlite3_column_type(st, 1) != SQLITE_NULL) {
            lumis.insert(static_cast<ledger::model::LumiNumber>(ColU64(st, 1)));
        }
    });
    ledger::util::ThrowIfDbError(res, "GetRuns");

    ledger::model::RunSet out;
    for (auto& [run, lumis] : runs) out.Add(ledger::model::Run(run, std::move(lumis)));
    return out;
}

// ------------------------------------------------------------------
// Locations
// ------------------------------------------------------------------

Result SqliteRepository::AddLocation(Transaction& t, const std::string& site) {
    return Exec(t, Operation::kAddLocation, {site});
}

Result SqliteRepository::AddFileLocation(Transaction& t, uint64_t file_id, const std::string& site) {
    auto res = AddLocation(t, site);
    if (!res) return res;
    return Exec(t, Operation::kAddFileLocation, {file_id, site});
}

ledger::model::SiteSet SqliteRepository::GetLocations(Transaction& t, uint64_t file_id) {
    ledger::model::SiteSet out;
    auto res = Query(t, Operation::kGetLocations, {file_id}, [&](sqlite3_stmt* st) { out.insert(ColText(st, 0)); });
    ledger::util::ThrowIfDbError(res, "GetLocations");
    return out;
}

// ------------------------------------------------------------------
// Lineage
// ------------------------------------------------------------------

Result SqliteRepository::AddLineage(Transaction& t, const model::LineageRow& edge) {
    const uint64_t ts = edge.created_at_ms ? edge.created_at_ms : ledger::util::NowMillis();
    return Exec(t, Operation::kAddLineage, {edge.parent_lfn, edge.child_lfn, ts});
}

std::vector<std::string> SqliteRepository::GetParents(Transaction& t, const std::string& child_lfn) {
    std::vector<std::string> out;
    auto res = Query(t, Operation::kGetParents, {child_lfn}, [&](sqlite3_stmt* st) { out.push_back(ColText(st, 0)); });
    return ReadStrings(res, std::move(out), "GetParents");
}

std::vector<std::string> SqliteRepository::GetChildren(Transaction& t, const std::string& parent_lfn) {
    std::vector<std::string> out;
    auto res = Query(t, Operation::kGetChildren, {parent_lfn}, [&](sqlite3_stmt* st) { out.push_back(ColText(st, 0)); });
    return ReadStrings(res, std::move(out), "GetChildren");
}

std::vector<ledger::model::FileStatus> SqliteRepository::GetParentStatus(Transaction& t, const std::string& child_lfn) {
    std::vector<ledger::model::FileStatus> out;
    auto res = Query(t, Operation::kGetParentStatus, {child_lfn},
                     [&](sqlite3_stmt* st) { out.push_back(ColFileStatus(st, 0)); });
    ledger::util::ThrowIfDbError(res, "GetParentStatus");
    return out;
}

// ------------------------------------------------------------------
// Blocks
// ------------------------------------------------------------------

Result SqliteRepository::SetBlockStatus(Transaction& t, const std::string& block, ledger::model::BlockStatus status) {
    return Exec(t, Operation::kSetBlockStatus, {block, Text(status), ledger::util::NowMillis()});
}

Result SqliteRepository::AddBlockLocation(Transaction& t, const std::string& block, const std::string& site) {
    auto res = AddLocation(t, site);
    if (!res) return res;
    return Exec(t, Operation::kAddBlockLocation, {block, site});
}

std::optional<model::BlockRow> SqliteRepository::GetBlockInfo(Transaction& t, const std::string& block) {
    std::optional<model::BlockRow> out;
    auto res = Query(t, Operation::kGetBlockStatus, {block}, [&](sqlite3_stmt* st) {
        model::BlockRow row;
        row.name          = ColText(st, 0);
        row.status        = ColBlockStatus(st, 1);
        row.created_at_ms = ColU64(st, 2);
        out               = std::move(row);
    });
    ledger::util::ThrowIfDbError(res, "GetBlockInfo");
    if (!out) return out;

    res = Query(t, Operation::kGetBlockLocations, {block},
                [&](sqlite3_stmt* st) { out->locations.insert(ColText(st, 0)); });
    ledger::util::ThrowIfDbError(res, "GetBlockInfo");
    return out;
}

Result SqliteRepository::SetBlock(Transaction& t, const std::string& lfn, const std::string& block) {
    int changes = 0;
    auto res = Exec(t, Operation::kSetBlock, {block, lfn}, &changes);
    if (!res) return res;
    if (changes == 0) return Result::Err(ErrorCode::NotFound, "lfn " + lfn);
    return Result::Ok();
}

std::optional<std::string> SqliteRepository::GetBlock(Transaction& t, const std::string& lfn) {
    std::optional<std::string> out;
    auto res = Query(t, Operation::kGetBlock, {lfn}, [&](sqlite3_stmt* st) { out = ColText(st, 0); });
    ledger::util::ThrowIfDbError(res, "GetBlock");
    if (out && out->empty()) return std::nullopt;
    return out;
}

std::vector<std::string> SqliteRepository::GetBlockFiles(Transaction& t, const std::string& block) {
    std::vector<std::string> out;
    auto res = Query(t, Operation::kGetBlockFiles, {block}, [&](sqlite3_stmt* st) { out.push_back(ColText(st, 0)); });
    return ReadStrings(res, std::move(out), "GetBlockFiles");
}

// ------------------------------------------------------------------
// Upload discovery
// ------------------------------------------------------------------

std::vector<std::string> SqliteRepository::FindUploadableDatasets(Transaction& t) {
    std::vector<std::string> out;
    auto res = Query(t, Operation::kFindUploadableDatasets, {}, [&](sqlite3_stmt* st) { out.push_back(ColText(st, 0)); });
    return ReadStrings(res, std::move(out), "FindUploadableDatasets");
}

std::vector<model::FileRow> SqliteRepository::FindUploadableFiles(Transaction& t, const std::string& dataset_path,
                                                                  std::size_t max_files) {
    std::vector<model::FileRow> out;
    auto res = Query(t, Operation::kFindUploadableFiles, {dataset_path, static_cast<uint64_t>(max_files)},
                     [&](sqlite3_stmt* st) { out.push_back(ReadFile(st)); });
    ledger::util::ThrowIfDbError(res, "FindUploadableFiles");
    return out;
}

std::vector<model::AlgorithmRow> SqliteRepository::FindAlgos(Transaction& t, const std::string& dataset_path) {
    std::vector<model::AlgorithmRow> out;
    auto res = Query(t, Operation::kFindAlgos, {dataset_path}, [&](sqlite3_stmt* st) { out.push_back(ReadAlgorithm(st)); });
    ledger::util::ThrowIfDbError(res, "FindAlgos");
    return out;
}

Result SqliteRepository::UpdateFileStatus(Transaction& t, uint64_t file_id, ledger::model::FileStatus status) {
    int changes = 0;
    auto res = Exec(t, Operation::kUpdateFilesStatus, {Text(status), file_id}, &changes);
    if (!res) return res;
    if (changes == 0) return Result::Err(ErrorCode::NotFound, "file id " + std::to_string(file_id));
    return Result::Ok();
}

} // namespace ledger::db::sqlite
