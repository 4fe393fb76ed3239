#include "internal/core/file_record.hpp"

#include <utility>

#include "internal/lineage/lineage_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::core {

FileRecord::FileRecord(std::string lfn, uint64_t size_bytes, uint64_t events, ledger::model::Checksums checksums,
                       ledger::model::SiteSet locations)
    : lfn_(std::move(lfn)),
      size_bytes_(size_bytes),
      events_(events),
      checksums_(std::move(checksums)) {
  auto& sites   = sites_.state();
  sites.known   = locations;
  sites.pending = std::move(locations);
}

FileRecord::FileRecord(std::string lfn, uint64_t size_bytes, uint64_t events, ledger::model::Checksums checksums,
                       const std::string& location)
    : FileRecord(std::move(lfn), size_bytes, events, std::move(checksums), ledger::model::SiteSet{location}) {
}

FileRecord::~FileRecord() {
  // an open handle can still flush the buffer and warns on its own
  const auto& pending = std::as_const(sites_).state().pending;
  if (!pending.empty() && !sites_.HasOpenHandles()) {
    LEDGER_LOG_WARN("File record destroyed with unwritten locations",
                    {ledger::observability::StringField("lfn", lfn_),
                     ledger::observability::IntField("sites", static_cast<int64_t>(pending.size()))});
  }
}

FileRecord FileRecord::WithId(FileId id) {
  FileRecord record;
  record.id_ = id;
  return record;
}

void FileRecord::SetAlgorithm(std::string app_name, std::string app_version, std::string app_family,
                              std::string pset_hash, std::string config_content) {
  algorithm_ = ledger::model::Algorithm{std::move(app_name), std::move(app_version), std::move(app_family),
                                        std::move(pset_hash), std::move(config_content)};
}

void FileRecord::SetDatasetPath(std::string path) {
  dataset_path_ = std::move(path);
}

void FileRecord::AddRun(const ledger::model::Run& run) {
  runs_.Add(run);
}

void FileRecord::AddRunSet(const ledger::model::RunSet& runs) {
  runs_.Merge(runs);
}

void FileRecord::AddRunSet(db::Repository& repo, db::Transaction& tx, const ledger::model::RunSet& runs) {
  runs_.Merge(runs);
  if (auto id = Exists(repo, tx)) {
    ledger::util::ThrowIfDbError(repo.AddRuns(tx, *id, runs), "add runs to " + lfn_);
  }
}

// ---------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------

std::optional<FileId> FileRecord::Exists(db::Repository& repo, db::Transaction& tx) const {
  if (!lfn_.empty()) {
    if (auto row = repo.GetFileByLfn(tx, lfn_)) {
      return row->id;
    }
    return std::nullopt;
  }
  if (id_ && repo.GetFileById(tx, *id_)) {
    return id_;
  }
  return std::nullopt;
}

FileId FileRecord::ResolveId(db::Repository& repo, db::Transaction& tx, const char* context) const {
  if (auto id = Exists(repo, tx)) {
    return *id;
  }
  const auto who = lfn_.empty() ? (id_ ? "id " + std::to_string(*id_) : std::string("unnamed record")) : lfn_;
  throw ledger::util::NotFoundError(std::string(context) + ": no file " + who);
}

const std::string& FileRecord::ResolveLfn(db::Repository& repo, db::Transaction& tx) {
  if (lfn_.empty()) {
    if (!id_) {
      throw ledger::util::ValidationError("file record has neither lfn nor id");
    }
    auto row = repo.GetFileById(tx, *id_);
    if (!row) {
      throw ledger::util::NotFoundError("no file with id " + std::to_string(*id_));
    }
    lfn_ = row->lfn;
  }
  return lfn_;
}

void FileRecord::Create(db::Repository& repo, db::Transaction& tx) {
  if (lfn_.empty()) {
    throw ledger::util::ValidationError("create: file record has no lfn");
  }
  if (!algorithm_.IsSet()) {
    throw ledger::util::ValidationError("create " + lfn_ + ": algorithm not set");
  }
  if (dataset_path_.empty()) {
    throw ledger::util::ValidationError("create " + lfn_ + ": dataset path not set");
  }
  if (repo.GetFileByLfn(tx, lfn_)) {
    throw ledger::util::DuplicateError("create: lfn already exists: " + lfn_);
  }

  db::model::AlgorithmRow algo;
  algo.algorithm = algorithm_;
  ledger::util::ThrowIfDbError(repo.UpsertAlgorithm(tx, algo), "create " + lfn_ + ": store algorithm");

  db::model::FileRow row;
  row.lfn          = lfn_;
  row.size_bytes   = size_bytes_;
  row.events       = events_;
  row.dataset_path = dataset_path_;
  row.algorithm_id = algo.id;
  row.status       = status_;
  ledger::util::ThrowIfDbError(repo.InsertFile(tx, row), "create " + lfn_);

  ledger::util::ThrowIfDbError(repo.AddChecksums(tx, row.id, checksums_), "create " + lfn_ + ": checksums");
  ledger::util::ThrowIfDbError(repo.AddRuns(tx, row.id, runs_), "create " + lfn_ + ": runs");
  auto& sites = sites_.state();
  location::LocationManager(repo).Persist(tx, row.id, sites.known);

  id_ = row.id;
  sites.pending.clear();
}

void FileRecord::Delete(db::Repository& repo, db::Transaction& tx) {
  const auto id = ResolveId(repo, tx, "delete");
  ledger::util::ThrowIfDbError(repo.DeleteFile(tx, id), "delete " + lfn_);
}

void FileRecord::Load(db::Repository& repo, db::Transaction& tx, bool parentage) {
  std::optional<db::model::FileRow> row;
  if (id_) {
    row = repo.GetFileById(tx, *id_);
  } else if (!lfn_.empty()) {
    row = repo.GetFileByLfn(tx, lfn_);
  } else {
    throw ledger::util::ValidationError("load: file record has neither lfn nor id");
  }
  if (!row) {
    throw ledger::util::NotFoundError("load: no file " + (id_ ? "id " + std::to_string(*id_) : lfn_));
  }

  id_           = row->id;
  lfn_          = row->lfn;
  size_bytes_   = row->size_bytes;
  events_       = row->events;
  dataset_path_ = row->dataset_path;
  status_       = row->status;
  block_        = row->block_name.empty() ? std::nullopt : std::optional<std::string>(row->block_name);

  auto algo = repo.GetAlgorithm(tx, row->algorithm_id);
  if (!algo) {
    throw ledger::util::NotFoundError("load " + lfn_ + ": missing algorithm " + std::to_string(row->algorithm_id));
  }
  algorithm_ = algo->algorithm;

  checksums_ = repo.GetChecksums(tx, row->id);
  runs_      = repo.GetRuns(tx, row->id);

  // buffered sites survive a reload
  auto& sites = sites_.state();
  sites.known = location::LocationManager(repo).List(tx, row->id);
  sites.known.insert(sites.pending.begin(), sites.pending.end());

  lineage::LineageManager lineage(repo);
  auto parents = lineage.GetParents(tx, lfn_);
  auto children = lineage.GetChildren(tx, lfn_);
  parent_lfns_ = {parents.begin(), parents.end()};
  child_lfns_  = {children.begin(), children.end()};

  parents_.clear();
  if (!parentage) {
    return;
  }
  for (const auto& parent_lfn : parent_lfns_) {
    FileRecord parent(parent_lfn);
    if (parent.Exists(repo, tx)) {
      parent.Load(repo, tx, false);
    }
    parents_.push_back(std::move(parent));
  }
}

// ---------------------------------------------------------------------
// Locations
// ---------------------------------------------------------------------

void FileRecord::SetLocation(db::Repository& repo, db::Transaction& tx, const ledger::model::SiteSet& sites) {
  const auto id = ResolveId(repo, tx, "set location");

  auto& buffer = sites_.state();

  ledger::model::SiteSet to_write = buffer.pending;
  to_write.insert(sites.begin(), sites.end());
  location::LocationManager(repo).Persist(tx, id, to_write);

  buffer.known.insert(sites.begin(), sites.end());
  buffer.pending.clear();
}

void FileRecord::SetLocation(db::Repository& repo, db::Transaction& tx, const std::string& site) {
  SetLocation(repo, tx, ledger::model::SiteSet{site});
}

location::PendingLocations FileRecord::DeferLocation(const ledger::model::SiteSet& sites) {
  auto& buffer = sites_.state();

  ledger::model::SiteSet added;
  for (const auto& site : sites) {
    if (buffer.known.insert(site).second) {
      buffer.pending.insert(site);
      added.insert(site);
    }
  }
  return location::PendingLocations(sites_.Share(), lfn_, id_, std::move(added));
}

location::PendingLocations FileRecord::DeferLocation(const std::string& site) {
  return DeferLocation(ledger::model::SiteSet{site});
}

void FileRecord::FlushLocations(db::Repository& repo, db::Transaction& tx) {
  auto& buffer = sites_.state();
  if (buffer.pending.empty()) {
    return;
  }
  const auto id = ResolveId(repo, tx, "flush locations");
  location::LocationManager(repo).Persist(tx, id, buffer.pending);
  buffer.pending.clear();
}

// ---------------------------------------------------------------------
// Lineage
// ---------------------------------------------------------------------

void FileRecord::AddParents(db::Repository& repo, db::Transaction& tx, const std::vector<std::string>& lfns) {
  lineage::LineageManager(repo).AddParents(tx, ResolveLfn(repo, tx), lfns);
  parent_lfns_.insert(lfns.begin(), lfns.end());
}

void FileRecord::AddChildren(db::Repository& repo, db::Transaction& tx, const std::vector<std::string>& lfns) {
  lineage::LineageManager(repo).AddChildren(tx, ResolveLfn(repo, tx), lfns);
  child_lfns_.insert(lfns.begin(), lfns.end());
}

void FileRecord::AddChildren(db::Repository& repo, db::Transaction& tx, const std::string& lfn) {
  AddChildren(repo, tx, std::vector<std::string>{lfn});
}

std::set<std::string> FileRecord::GetParentLFNs(db::Repository& repo, db::Transaction& tx) {
  auto parents = lineage::LineageManager(repo).GetParents(tx, ResolveLfn(repo, tx));
  parent_lfns_ = {parents.begin(), parents.end()};
  return parent_lfns_;
}

bool FileRecord::operator==(const FileRecord& other) const {
  return id_ == other.id_ && lfn_ == other.lfn_ && size_bytes_ == other.size_bytes_ && events_ == other.events_ &&
         checksums_ == other.checksums_ && algorithm_ == other.algorithm_ && dataset_path_ == other.dataset_path_ &&
         runs_ == other.runs_ && locations() == other.locations() && status_ == other.status_;
}

} // namespace ledger::core
