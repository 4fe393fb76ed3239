#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/algorithm.hpp"
#include "internal/model/file_status.hpp"

namespace ledger::upload {

// What the uploader needs to ship a file.
struct FileSummary {
  uint64_t    id = 0;
  std::string lfn;
  uint64_t    size_bytes = 0;
  uint64_t    events     = 0;
  std::string block;  // empty when unassigned

  bool operator==(const FileSummary&) const = default;
};

/*
  Read side of the upload workflow, plus the status transition that
  closes it.

  A file is uploadable when it is NOTUPLOADED and every tracked parent
  is already in the catalog (UPLOADED or ALREADY_IN_CATALOG).
*/
class DiscoveryQueries {
 public:
  explicit DiscoveryQueries(db::Repository& repo);

  // Sorted dataset paths with at least one NOTUPLOADED file.
  std::vector<std::string> FindUploadableDatasets(db::Transaction& tx);

  // Oldest first, at most max_files entries.
  std::vector<FileSummary> FindUploadableFiles(db::Transaction& tx, const std::string& dataset_path,
                                               std::size_t max_files);

  std::vector<ledger::model::Algorithm> FindAlgos(db::Transaction& tx, const std::string& dataset_path);

  // All or nothing: every id is checked before any status changes.
  // Throws util::NotFoundError naming the first unknown id.
  void UpdateFilesStatus(db::Transaction& tx, const std::vector<uint64_t>& file_ids,
                         ledger::model::FileStatus status = ledger::model::FileStatus::kUploaded);

  uint64_t CountFiles(db::Transaction& tx);

 private:
  db::Repository& repo_;
};

} // namespace ledger::upload
