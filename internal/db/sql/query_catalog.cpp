#include "query_catalog.hpp"

#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"

namespace ledger::db::sql {

namespace {

constexpr std::array<std::string_view, kOperationCount> kOperationNames = {
    "InsertAlgorithm",
    "GetAlgorithmByKey",
    "GetAlgorithm",
    "InsertFile",
    "GetFileById",
    "GetFileByLfn",
    "DeleteFile",
    "DeleteFileLineage",
    "CountFiles",
    "AddChecksum",
    "GetChecksums",
    "AddRun",
    "AddLumi",
    "GetRuns",
    "AddLocation",
    "AddFileLocation",
    "GetLocations",
    "AddLineage",
    "GetParents",
    "GetChildren",
    "GetParentStatus",
    "SetBlockStatus",
    "GetBlockStatus",
    "AddBlockLocation",
    "GetBlockLocations",
    "SetBlock",
    "GetBlock",
    "GetBlockFiles",
    "FindUploadableDatasets",
    "FindUploadableFiles",
    "FindAlgos",
    "UpdateFilesStatus",
};

constexpr const char* kFileColumns =
    "id,lfn,size_bytes,events,dataset_path,algo_id,status,COALESCE(block_name,''),created_at_ms";

// ---------------------------------------------------------------------
// Canonical SQL (SQLite-compatible subset, ? placeholders)
// ---------------------------------------------------------------------

std::vector<std::pair<Operation, std::string>> CanonicalQueries() {
  const std::string file_columns = kFileColumns;
  return {
      // algorithms
      {Operation::kInsertAlgorithm,
       "INSERT INTO ledger_algo(app_name,app_ver,app_fam,pset_hash,config_content) VALUES(?,?,?,?,?)"
       " ON CONFLICT(app_name,app_ver,app_fam,pset_hash) DO NOTHING;"},
      {Operation::kGetAlgorithmByKey,
       "SELECT id,app_name,app_ver,app_fam,pset_hash,COALESCE(config_content,'') FROM ledger_algo"
       " WHERE app_name=? AND app_ver=? AND app_fam=? AND pset_hash=?;"},
      {Operation::kGetAlgorithm,
       "SELECT id,app_name,app_ver,app_fam,pset_hash,COALESCE(config_content,'') FROM ledger_algo WHERE id=?;"},

      // files
      {Operation::kInsertFile,
       "INSERT INTO ledger_file(lfn,size_bytes,events,dataset_path,algo_id,status,block_name,created_at_ms)"
       " VALUES(?,?,?,?,?,?,NULLIF(?,''),?);"},
      {Operation::kGetFileById, "SELECT " + file_columns + " FROM ledger_file WHERE id=?;"},
      {Operation::kGetFileByLfn, "SELECT " + file_columns + " FROM ledger_file WHERE lfn=?;"},
      {Operation::kDeleteFile, "DELETE FROM ledger_file WHERE id=?;"},
      {Operation::kDeleteFileLineage,
       "DELETE FROM ledger_lineage WHERE (SELECT lfn FROM ledger_file WHERE id=?) IN (parent_lfn,child_lfn);"},
      {Operation::kCountFiles, "SELECT COUNT(*) FROM ledger_file;"},

      // descriptors
      {Operation::kAddChecksum,
       "INSERT INTO ledger_checksum(file_id,algorithm,digest) VALUES(?,?,?)"
       " ON CONFLICT(file_id,algorithm) DO UPDATE SET digest=excluded.digest;"},
      {Operation::kGetChecksums, "SELECT algorithm,digest FROM ledger_checksum WHERE file_id=?;"},
      {Operation::kAddRun, "INSERT INTO ledger_run(file_id,run) VALUES(?,?) ON CONFLICT DO NOTHING;"},
      {Operation::kAddLumi, "INSERT INTO ledger_lumi(file_id,run,lumi) VALUES(?,?,?) ON CONFLICT DO NOTHING;"},
      {Operation::kGetRuns,
       "SELECT r.run,l.lumi FROM ledger_run r"
       " LEFT JOIN ledger_lumi l ON l.file_id=r.file_id AND l.run=r.run"
       " WHERE r.file_id=? ORDER BY r.run,l.lumi;"},

      // locations
      {Operation::kAddLocation, "INSERT INTO ledger_location(site) VALUES(?) ON CONFLICT(site) DO NOTHING;"},
      {Operation::kAddFileLocation,
       "INSERT INTO ledger_file_location(file_id,location_id)"
       " SELECT CAST(? AS BIGINT),id FROM ledger_location WHERE site=? ON CONFLICT DO NOTHING;"},
      {Operation::kGetLocations,
       "SELECT l.site FROM ledger_file_location fl JOIN ledger_location l ON l.id=fl.location_id"
       " WHERE fl.file_id=? ORDER BY l.site;"},

      // lineage
      {Operation::kAddLineage,
       "INSERT INTO ledger_lineage(parent_lfn,child_lfn,created_at_ms) VALUES(?,?,?)"
       " ON CONFLICT(parent_lfn,child_lfn) DO NOTHING;"},
      {Operation::kGetParents, "SELECT parent_lfn FROM ledger_lineage WHERE child_lfn=? ORDER BY parent_lfn;"},
      {Operation::kGetChildren, "SELECT child_lfn FROM ledger_lineage WHERE parent_lfn=? ORDER BY child_lfn;"},
      {Operation::kGetParentStatus,
       "SELECT p.status FROM ledger_lineage l JOIN ledger_file p ON p.lfn=l.parent_lfn"
       " WHERE l.child_lfn=? ORDER BY p.id;"},

      // blocks
      {Operation::kSetBlockStatus,
       "INSERT INTO ledger_block(name,status,created_at_ms) VALUES(?,?,?)"
       " ON CONFLICT(name) DO UPDATE SET status=excluded.status;"},
      {Operation::kGetBlockStatus, "SELECT name,status,created_at_ms FROM ledger_block WHERE name=?;"},
      {Operation::kAddBlockLocation,
       "INSERT INTO ledger_block_location(block_name,location_id)"
       " SELECT ?,id FROM ledger_location WHERE site=? ON CONFLICT DO NOTHING;"},
      {Operation::kGetBlockLocations,
       "SELECT l.site FROM ledger_block_location bl JOIN ledger_location l ON l.id=bl.location_id"
       " WHERE bl.block_name=? ORDER BY l.site;"},
      {Operation::kSetBlock, "UPDATE ledger_file SET block_name=? WHERE lfn=?;"},
      {Operation::kGetBlock, "SELECT COALESCE(block_name,'') FROM ledger_file WHERE lfn=?;"},
      {Operation::kGetBlockFiles, "SELECT lfn FROM ledger_file WHERE block_name=? ORDER BY id;"},

      // upload discovery
      {Operation::kFindUploadableDatasets,
       "SELECT DISTINCT dataset_path FROM ledger_file WHERE status='NOTUPLOADED' ORDER BY dataset_path;"},
      {Operation::kFindUploadableFiles,
       "SELECT " + file_columns + " FROM ledger_file f"
       " WHERE f.dataset_path=? AND f.status='NOTUPLOADED'"
       " AND NOT EXISTS (SELECT 1 FROM ledger_lineage l JOIN ledger_file p ON p.lfn=l.parent_lfn"
       " WHERE l.child_lfn=f.lfn AND p.status NOT IN ('UPLOADED','ALREADY_IN_CATALOG'))"
       " ORDER BY f.id ASC LIMIT ?;"},
      {Operation::kFindAlgos,
       "SELECT DISTINCT a.id,a.app_name,a.app_ver,a.app_fam,a.pset_hash,COALESCE(a.config_content,'')"
       " FROM ledger_algo a JOIN ledger_file f ON f.algo_id=a.id WHERE f.dataset_path=? ORDER BY a.id;"},
      {Operation::kUpdateFilesStatus, "UPDATE ledger_file SET status=? WHERE id=?;"},
  };
}

std::vector<std::string> SqliteSchema() {
  return {
      "CREATE TABLE IF NOT EXISTS ledger_algo (id INTEGER PRIMARY KEY AUTOINCREMENT, app_name TEXT NOT NULL, app_ver TEXT NOT NULL, app_fam TEXT NOT NULL, pset_hash TEXT NOT NULL, config_content TEXT, UNIQUE(app_name, app_ver, app_fam, pset_hash));",
      "CREATE TABLE IF NOT EXISTS ledger_block (name TEXT PRIMARY KEY, status TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS ledger_file (id INTEGER PRIMARY KEY AUTOINCREMENT, lfn TEXT NOT NULL UNIQUE, size_bytes INTEGER NOT NULL, events INTEGER NOT NULL, dataset_path TEXT NOT NULL, algo_id INTEGER NOT NULL REFERENCES ledger_algo(id), status TEXT NOT NULL, block_name TEXT REFERENCES ledger_block(name), created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ledger_file_dataset_status ON ledger_file(dataset_path, status);",
      "CREATE TABLE IF NOT EXISTS ledger_checksum (file_id INTEGER NOT NULL REFERENCES ledger_file(id) ON DELETE CASCADE, algorithm TEXT NOT NULL, digest TEXT NOT NULL, PRIMARY KEY(file_id, algorithm));",
      "CREATE TABLE IF NOT EXISTS ledger_run (file_id INTEGER NOT NULL REFERENCES ledger_file(id) ON DELETE CASCADE, run INTEGER NOT NULL, PRIMARY KEY(file_id, run));",
      "CREATE TABLE IF NOT EXISTS ledger_lumi (file_id INTEGER NOT NULL REFERENCES ledger_file(id) ON DELETE CASCADE, run INTEGER NOT NULL, lumi INTEGER NOT NULL, PRIMARY KEY(file_id, run, lumi));",
      "CREATE TABLE IF NOT EXISTS ledger_location (id INTEGER PRIMARY KEY AUTOINCREMENT, site TEXT NOT NULL UNIQUE);",
      "CREATE TABLE IF NOT EXISTS ledger_file_location (file_id INTEGER NOT NULL REFERENCES ledger_file(id) ON DELETE CASCADE, location_id INTEGER NOT NULL REFERENCES ledger_location(id), PRIMARY KEY(file_id, location_id));",
      "CREATE TABLE IF NOT EXISTS ledger_block_location (block_name TEXT NOT NULL REFERENCES ledger_block(name) ON DELETE CASCADE, location_id INTEGER NOT NULL REFERENCES ledger_location(id), PRIMARY KEY(block_name, location_id));",
      "CREATE TABLE IF NOT EXISTS ledger_lineage (parent_lfn TEXT NOT NULL, child_lfn TEXT NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY(parent_lfn, child_lfn));",
      "CREATE INDEX IF NOT EXISTS ledger_lineage_child ON ledger_lineage(child_lfn);",
  };
}

std::vector<std::string> PostgresSchema() {
  return {
      "CREATE TABLE IF NOT EXISTS ledger_algo (id BIGSERIAL PRIMARY KEY, app_name TEXT NOT NULL, app_ver TEXT NOT NULL, app_fam TEXT NOT NULL, pset_hash TEXT NOT NULL, config_content TEXT, UNIQUE(app_name, app_ver, app_fam, pset_hash));",
      "CREATE TABLE IF NOT EXISTS ledger_block (name TEXT PRIMARY KEY, status TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS ledger_file (id BIGSERIAL PRIMARY KEY, lfn TEXT NOT NULL UNIQUE, size_bytes BIGINT NOT NULL, events BIGINT NOT NULL, dataset_path TEXT NOT NULL, algo_id BIGINT NOT NULL REFERENCES ledger_algo(id), status TEXT NOT NULL, block_name TEXT REFERENCES ledger_block(name), created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ledger_file_dataset_status ON ledger_file(dataset_path, status);",
      "CREATE TABLE IF NOT EXISTS ledger_checksum (file_id BIGINT NOT NULL REFERENCES ledger_file(id) ON DELETE CASCADE, algorithm TEXT NOT NULL, digest TEXT NOT NULL, PRIMARY KEY(file_id, algorithm));",
      "CREATE TABLE IF NOT EXISTS ledger_run (file_id BIGINT NOT NULL REFERENCES ledger_file(id) ON DELETE CASCADE, run BIGINT NOT NULL, PRIMARY KEY(file_id, run));",
      "CREATE TABLE IF NOT EXISTS ledger_lumi (file_id BIGINT NOT NULL REFERENCES ledger_file(id) ON DELETE CASCADE, run BIGINT NOT NULL, lumi BIGINT NOT NULL, PRIMARY KEY(file_id, run, lumi));",
      "CREATE TABLE IF NOT EXISTS ledger_location (id BIGSERIAL PRIMARY KEY, site TEXT NOT NULL UNIQUE);",
      "CREATE TABLE IF NOT EXISTS ledger_file_location (file_id BIGINT NOT NULL REFERENCES ledger_file(id) ON DELETE CASCADE, location_id BIGINT NOT NULL REFERENCES ledger_location(id), PRIMARY KEY(file_id, location_id));",
      "CREATE TABLE IF NOT EXISTS ledger_block_location (block_name TEXT NOT NULL REFERENCES ledger_block(name) ON DELETE CASCADE, location_id BIGINT NOT NULL REFERENCES ledger_location(id), PRIMARY KEY(block_name, location_id));",
      "CREATE TABLE IF NOT EXISTS ledger_lineage (parent_lfn TEXT NOT NULL, child_lfn TEXT NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY(parent_lfn, child_lfn));",
      "CREATE INDEX IF NOT EXISTS ledger_lineage_child ON ledger_lineage(child_lfn);",
  };
}

} // namespace

std::string_view OperationName(Operation op) {
  const auto index = static_cast<std::size_t>(op);
  if (index >= kOperationCount) {
    return "Unknown";
  }
  return kOperationNames[index];
}

std::optional<Operation> OperationFromName(std::string_view name) {
  for (std::size_t i = 0; i < kOperationCount; ++i) {
    if (kOperationNames[i] == name) {
      return static_cast<Operation>(i);
    }
  }
  return std::nullopt;
}

std::string_view DialectName(Dialect dialect) {
  switch (dialect) {
    case Dialect::kPostgres:
      return "postgres";
    case Dialect::kSqlite:
    default:
      return "sqlite";
  }
}

const QueryCatalog& QueryCatalog::ForDialect(Dialect dialect) {
  static const QueryCatalog sqlite_catalog(Dialect::kSqlite);
  static const QueryCatalog postgres_catalog(Dialect::kPostgres);
  return dialect == Dialect::kPostgres ? postgres_catalog : sqlite_catalog;
}

QueryCatalog::QueryCatalog(Dialect dialect) : dialect_(dialect) {
  for (auto& [op, sql] : CanonicalQueries()) {
    Register(op, dialect_ == Dialect::kPostgres ? ToPositional(sql) : std::move(sql));
  }

  if (dialect_ == Dialect::kPostgres) {
    // Postgres hands back generated ids through RETURNING.
    Register(Operation::kInsertFile,
             ToPositional("INSERT INTO ledger_file(lfn,size_bytes,events,dataset_path,algo_id,status,block_name,created_at_ms)"
                          " VALUES(?,?,?,?,?,?,NULLIF(?,''),?) RETURNING id;"));
    schema_ = PostgresSchema();
  } else {
    schema_ = SqliteSchema();
  }

  for (std::size_t i = 0; i < kOperationCount; ++i) {
    if (queries_[i].empty()) {
      throw std::logic_error("query catalog: no " + std::string(DialectName(dialect_)) + " query for " +
                             std::string(kOperationNames[i]));
    }
  }
}

void QueryCatalog::Register(Operation op, std::string sql) {
  queries_[static_cast<std::size_t>(op)] = std::move(sql);
}

const std::string& QueryCatalog::Get(Operation op) const {
  return queries_.at(static_cast<std::size_t>(op));
}

const std::string& QueryCatalog::Get(std::string_view name) const {
  auto op = OperationFromName(name);
  if (!op) {
    throw ledger::util::NotFoundError("query catalog: unknown operation '" + std::string(name) + "'");
  }
  return Get(*op);
}

std::string ToPositional(std::string_view sql) {
  std::string out;
  out.reserve(sql.size() + 16);

  bool in_literal = false;
  int  next_index = 1;
  for (char c : sql) {
    if (c == '\'') {
      in_literal = !in_literal;
      out.push_back(c);
      continue;
    }
    if (c == '?' && !in_literal) {
      out.push_back('$');
      out += std::to_string(next_index++);
      continue;
    }
    out.push_back(c);
  }
  return out;
}

} // namespace ledger::db::sql
