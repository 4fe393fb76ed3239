#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/location/location_manager.hpp"
#include "internal/model/algorithm.hpp"
#include "internal/model/file_status.hpp"
#include "internal/model/location.hpp"
#include "internal/model/run.hpp"

namespace ledger::core {

using FileId = uint64_t;

/*
  One tracked output file.

  Identity is the LFN and/or the id assigned by Create(); Load()
  resolves whichever is missing. Every storage access goes through the
  repository and transaction passed to the call, nothing is cached
  outside the object itself.

  Locations come in two flavours:
    SetLocation()    writes through immediately, together with any
                     sites still buffered on the record
    DeferLocation()  buffers in memory and hands back a PendingLocations
                     the caller must Flush() or Discard()

  Records are not thread-safe.
*/
class FileRecord {
 public:
  FileRecord() = default;
  explicit FileRecord(std::string lfn, uint64_t size_bytes = 0, uint64_t events = 0,
                      ledger::model::Checksums checksums = {}, ledger::model::SiteSet locations = {});
  FileRecord(std::string lfn, uint64_t size_bytes, uint64_t events, ledger::model::Checksums checksums,
             const std::string& location);

  // Copies get their own location buffer; moves keep open
  // PendingLocations handles attached to the moved-to record.
  FileRecord(const FileRecord&)                = default;
  FileRecord& operator=(const FileRecord&)     = default;
  FileRecord(FileRecord&&) noexcept            = default;
  FileRecord& operator=(FileRecord&&) noexcept = default;
  ~FileRecord();

  // A record known only by id, to be completed by Load().
  static FileRecord WithId(FileId id);

  // ---------------------------------------------------------------------
  // Descriptors, set before Create()
  // ---------------------------------------------------------------------

  void SetAlgorithm(std::string app_name, std::string app_version, std::string app_family, std::string pset_hash,
                    std::string config_content);
  void SetDatasetPath(std::string path);

  void AddRun(const ledger::model::Run& run);
  void AddRunSet(const ledger::model::RunSet& runs);

  // Same merge; also stored right away when the file already exists.
  void AddRunSet(db::Repository& repo, db::Transaction& tx, const ledger::model::RunSet& runs);

  // ---------------------------------------------------------------------
  // Persistence
  // ---------------------------------------------------------------------

  // Id of the stored file, nullopt when the transaction cannot see one.
  // Looks up by LFN when known, otherwise by id. Never throws for absence.
  std::optional<FileId> Exists(db::Repository& repo, db::Transaction& tx) const;

  // Throws util::ValidationError without LFN, algorithm or dataset path,
  // util::DuplicateError when the LFN is taken.
  void Create(db::Repository& repo, db::Transaction& tx);

  // Throws util::NotFoundError when the file is not stored.
  void Delete(db::Repository& repo, db::Transaction& tx);

  // With parentage, parents are loaded one level deep; parents that are
  // declared but untracked carry only their LFN.
  void Load(db::Repository& repo, db::Transaction& tx, bool parentage = false);

  // ---------------------------------------------------------------------
  // Locations
  // ---------------------------------------------------------------------

  void SetLocation(db::Repository& repo, db::Transaction& tx, const ledger::model::SiteSet& sites);
  void SetLocation(db::Repository& repo, db::Transaction& tx, const std::string& site);

  [[nodiscard]] location::PendingLocations DeferLocation(const ledger::model::SiteSet& sites);
  [[nodiscard]] location::PendingLocations DeferLocation(const std::string& site);

  // Writes every buffered site. The file must be stored.
  void FlushLocations(db::Repository& repo, db::Transaction& tx);

  // ---------------------------------------------------------------------
  // Lineage
  // ---------------------------------------------------------------------

  void AddParents(db::Repository& repo, db::Transaction& tx, const std::vector<std::string>& lfns);
  void AddChildren(db::Repository& repo, db::Transaction& tx, const std::vector<std::string>& lfns);
  void AddChildren(db::Repository& repo, db::Transaction& tx, const std::string& lfn);

  std::set<std::string> GetParentLFNs(db::Repository& repo, db::Transaction& tx);

  // ---------------------------------------------------------------------
  // Accessors
  // ---------------------------------------------------------------------

  std::optional<FileId> id() const {
    return id_;
  }
  const std::string& lfn() const {
    return lfn_;
  }
  uint64_t size_bytes() const {
    return size_bytes_;
  }
  uint64_t events() const {
    return events_;
  }
  const ledger::model::Checksums& checksums() const {
    return checksums_;
  }
  const ledger::model::Algorithm& algorithm() const {
    return algorithm_;
  }
  const std::string& dataset_path() const {
    return dataset_path_;
  }
  const ledger::model::RunSet& runs() const {
    return runs_;
  }
  const ledger::model::SiteSet& locations() const {
    return sites_.state().known;
  }
  const ledger::model::SiteSet& pending_locations() const {
    return sites_.state().pending;
  }
  ledger::model::FileStatus status() const {
    return status_;
  }
  const std::optional<std::string>& block() const {
    return block_;
  }
  const std::set<std::string>& parent_lfns() const {
    return parent_lfns_;
  }
  const std::set<std::string>& child_lfns() const {
    return child_lfns_;
  }
  // Filled by Load(parentage = true) only.
  const std::vector<FileRecord>& parents() const {
    return parents_;
  }

  // Descriptors, provenance, runs, locations and status; lineage and
  // block membership are not compared.
  bool operator==(const FileRecord& other) const;

 private:
  // Id of the stored row; throws util::NotFoundError.
  FileId ResolveId(db::Repository& repo, db::Transaction& tx, const char* context) const;
  // LFN, loading it by id when only the id is known.
  const std::string& ResolveLfn(db::Repository& repo, db::Transaction& tx);

  std::optional<FileId> id_;
  std::string           lfn_;
  uint64_t              size_bytes_ = 0;
  uint64_t              events_     = 0;

  ledger::model::Checksums  checksums_;
  ledger::model::Algorithm  algorithm_;
  std::string               dataset_path_;
  ledger::model::RunSet     runs_;
  ledger::model::FileStatus status_ = ledger::model::FileStatus::kNotUploaded;

  std::optional<std::string> block_;

  location::SiteBuffer sites_;

  std::set<std::string>   parent_lfns_;
  std::set<std::string>   child_lfns_;
  std::vector<FileRecord> parents_;
};

} // namespace ledger::core
