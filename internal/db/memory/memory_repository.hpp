#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ledger::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Each transaction works on a private copy of the committed state and
  publishes it on Commit(). A commit fails if another transaction
  published first, which keeps concurrent writers from losing updates.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    // ordered by id so iteration is oldest first
    std::map<uint64_t, model::FileRow> files;
    std::unordered_map<std::string, uint64_t> lfn_to_id;

    std::map<uint64_t, model::AlgorithmRow> algorithms;

    std::map<uint64_t, ledger::model::Checksums> checksums;
    std::map<uint64_t, ledger::model::RunSet> runs;

    std::set<std::string> sites;
    std::map<uint64_t, ledger::model::SiteSet> file_locations;

    // (parent_lfn, child_lfn)
    std::set<std::pair<std::string, std::string>> lineage;

    std::map<std::string, model::BlockRow> blocks;

    uint64_t next_file_id = 1;
    uint64_t next_algorithm_id = 1;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
