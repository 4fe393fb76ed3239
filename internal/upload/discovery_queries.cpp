#include "internal/upload/discovery_queries.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::upload {

DiscoveryQueries::DiscoveryQueries(db::Repository& repo) : repo_(repo) {
}

std::vector<std::string> DiscoveryQueries::FindUploadableDatasets(db::Transaction& tx) {
  return repo_.FindUploadableDatasets(tx);
}

std::vector<FileSummary> DiscoveryQueries::FindUploadableFiles(db::Transaction& tx, const std::string& dataset_path,
                                                               std::size_t max_files) {
  std::vector<FileSummary> out;
  if (max_files == 0) {
    return out;
  }

  for (const auto& row : repo_.FindUploadableFiles(tx, dataset_path, max_files)) {
    out.push_back(FileSummary{row.id, row.lfn, row.size_bytes, row.events, row.block_name});
  }
  return out;
}

std::vector<ledger::model::Algorithm> DiscoveryQueries::FindAlgos(db::Transaction& tx, const std::string& dataset_path) {
  std::vector<ledger::model::Algorithm> out;
  for (auto& row : repo_.FindAlgos(tx, dataset_path)) {
    out.push_back(std::move(row.algorithm));
  }
  return out;
}

void DiscoveryQueries::UpdateFilesStatus(db::Transaction& tx, const std::vector<uint64_t>& file_ids,
                                         ledger::model::FileStatus status) {
  for (auto id : file_ids) {
    if (!repo_.GetFileById(tx, id)) {
      throw ledger::util::NotFoundError("update status: no file with id " + std::to_string(id));
    }
  }

  for (auto id : file_ids) {
    ledger::util::ThrowIfDbError(repo_.UpdateFileStatus(tx, id, status), "update status of file " + std::to_string(id));
  }

  LEDGER_LOG_INFO("File status updated", {ledger::observability::StringField("status", ledger::model::ToString(status)),
                                          ledger::observability::IntField("files", static_cast<int64_t>(file_ids.size()))});
}

uint64_t DiscoveryQueries::CountFiles(db::Transaction& tx) {
  return repo_.CountFiles(tx);
}

} // namespace ledger::upload
