#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/algorithm_row.hpp"
#include "internal/db/model/block_row.hpp"
#include "internal/db/model/file_row.hpp"
#include "internal/db/model/lineage_row.hpp"
#include "internal/model/file_status.hpp"
#include "internal/model/location.hpp"
#include "internal/model/run.hpp"

namespace ledger::db {

/*
  Repository abstraction.

  One method per named query operation (see sql::Operation). SQL
  backends resolve the query text through the QueryCatalog of their
  dialect; the memory backend implements the same contract directly.

  CRITICAL GUARANTEES:

  - All reads and writes go through a caller-supplied Transaction
  - Reads inside a transaction see its writes
  - Rolled back writes are invisible everywhere
  - Repeated location/run/lineage inserts never duplicate rows

  The DB is the source of truth for:
    file descriptors and status
    locations
    lineage
    blocks
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Algorithms
  // ---------------------------------------------------------------------

  // Inserts the algorithm unless its identity tuple is already stored;
  // either way row.id is set to the stored id.
  virtual Result UpsertAlgorithm(Transaction&, model::AlgorithmRow& row) = 0;

  virtual std::optional<model::AlgorithmRow> GetAlgorithm(Transaction&, uint64_t id) = 0;

  // ---------------------------------------------------------------------
  // Files
  // ---------------------------------------------------------------------

  // Assigns row.id. AlreadyExists when the LFN is taken.
  virtual Result InsertFile(Transaction&, model::FileRow& row) = 0;

  virtual std::optional<model::FileRow> GetFileById(Transaction&, uint64_t id) = 0;

  virtual std::optional<model::FileRow> GetFileByLfn(Transaction&, const std::string& lfn) = 0;

  // Removes the file with its checksum, run, location rows and the
  // lineage edges naming it as child. NotFound when absent.
  virtual Result DeleteFile(Transaction&, uint64_t id) = 0;

  virtual uint64_t CountFiles(Transaction&) = 0;

  virtual Result AddChecksums(Transaction&, uint64_t file_id, const ledger::model::Checksums& checksums) = 0;

  virtual ledger::model::Checksums GetChecksums(Transaction&, uint64_t file_id) = 0;

  virtual Result AddRuns(Transaction&, uint64_t file_id, const ledger::model::RunSet& runs) = 0;

  virtual ledger::model::RunSet GetRuns(Transaction&, uint64_t file_id) = 0;

  // ---------------------------------------------------------------------
  // Locations
  // ---------------------------------------------------------------------

  // Registers a site name. Idempotent.
  virtual Result AddLocation(Transaction&, const std::string& site) = 0;

  // Maps a file to a site, registering the site if needed. Idempotent.
  virtual Result AddFileLocation(Transaction&, uint64_t file_id, const std::string& site) = 0;

  virtual ledger::model::SiteSet GetLocations(Transaction&, uint64_t file_id) = 0;

  // ---------------------------------------------------------------------
  // Lineage
  // ---------------------------------------------------------------------

  // Idempotent on (parent_lfn, child_lfn).
  virtual Result AddLineage(Transaction&, const model::LineageRow& edge) = 0;

  virtual std::vector<std::string> GetParents(Transaction&, const std::string& child_lfn) = 0;

  virtual std::vector<std::string> GetChildren(Transaction&, const std::string& parent_lfn) = 0;

  // Status of every tracked parent of child_lfn.
  virtual std::vector<ledger::model::FileStatus> GetParentStatus(Transaction&, const std::string& child_lfn) = 0;

  // ---------------------------------------------------------------------
  // Blocks
  // ---------------------------------------------------------------------

  // Creates the block or updates its status.
  virtual Result SetBlockStatus(Transaction&, const std::string& block, ledger::model::BlockStatus status) = 0;

  virtual Result AddBlockLocation(Transaction&, const std::string& block, const std::string& site) = 0;

  // Status and locations. nullopt when the block does not exist.
  virtual std::optional<model::BlockRow> GetBlockInfo(Transaction&, const std::string& block) = 0;

  // NotFound when the file does not exist. The block must exist.
  virtual Result SetBlock(Transaction&, const std::string& lfn, const std::string& block) = 0;

  // Block of the file, nullopt when unassigned or when the file does not exist.
  virtual std::optional<std::string> GetBlock(Transaction&, const std::string& lfn) = 0;

  virtual std::vector<std::string> GetBlockFiles(Transaction&, const std::string& block) = 0;

  // ---------------------------------------------------------------------
  // Upload discovery
  // ---------------------------------------------------------------------

  virtual std::vector<std::string> FindUploadableDatasets(Transaction&) = 0;

  // NOTUPLOADED files of the dataset whose tracked parents are all in the
  // catalog, oldest (lowest id) first, at most max_files.
  virtual std::vector<model::FileRow> FindUploadableFiles(Transaction&, const std::string& dataset_path,
                                                          std::size_t max_files) = 0;

  virtual std::vector<model::AlgorithmRow> FindAlgos(Transaction&, const std::string& dataset_path) = 0;

  // NotFound when the file does not exist.
  virtual Result UpdateFileStatus(Transaction&, uint64_t file_id, ledger::model::FileStatus status) = 0;
};

} // namespace ledger::db
