#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/algorithm.hpp"
#include "internal/model/file_status.hpp"
#include "internal/upload/discovery_queries.hpp"

namespace ledger::db {
class Repository;
}

namespace ledger::service {

/*
  Entry points for the upload orchestrator.

  Every call is its own unit of work: it begins a transaction, runs,
  and commits. Any failure is logged and rethrown with the transaction
  rolled back.
*/
class UploadService {
 public:
  explicit UploadService(std::shared_ptr<ledger::db::Repository> repository, std::size_t default_max_files = 10);

  std::vector<std::string> FindUploadableDatasets();

  std::vector<ledger::upload::FileSummary> FindUploadableFiles(const std::string& dataset_path);
  std::vector<ledger::upload::FileSummary> FindUploadableFiles(const std::string& dataset_path, std::size_t max_files);

  std::vector<ledger::model::Algorithm> FindAlgos(const std::string& dataset_path);

  void UpdateFilesStatus(const std::vector<uint64_t>& file_ids,
                         ledger::model::FileStatus status = ledger::model::FileStatus::kUploaded);

  uint64_t CountFiles();

 private:
  std::shared_ptr<ledger::db::Repository> repository_;
  std::size_t                             default_max_files_;
};

} // namespace ledger::service
