#include "upload_service.hpp"

#include <stdexcept>
#include <string_view>
#include <type_traits>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"

namespace ledger::service {

namespace {

// Runs fn(tx) in a fresh transaction and commits it.
template <typename Fn>
auto InTransaction(std::string_view route, ledger::db::Repository& repository, Fn&& fn) {
  try {
    auto tx = repository.Begin();
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, ledger::db::Transaction&>>) {
      fn(*tx);
      tx->Commit();
      return;
    } else {
      auto result = fn(*tx);
      tx->Commit();
      return result;
    }
  } catch (const std::exception& ex) {
    LEDGER_LOG_ERROR("Upload operation failed", {ledger::observability::StringField("route", route),
                                                 ledger::observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace

UploadService::UploadService(std::shared_ptr<ledger::db::Repository> repository, std::size_t default_max_files)
    : repository_(std::move(repository)), default_max_files_(default_max_files) {
  if (!repository_) {
    throw std::invalid_argument("UploadService requires a repository");
  }
}

std::vector<std::string> UploadService::FindUploadableDatasets() {
  return InTransaction("UploadService.FindUploadableDatasets", *repository_, [&](ledger::db::Transaction& tx) {
    return ledger::upload::DiscoveryQueries(*repository_).FindUploadableDatasets(tx);
  });
}

std::vector<ledger::upload::FileSummary> UploadService::FindUploadableFiles(const std::string& dataset_path) {
  return FindUploadableFiles(dataset_path, default_max_files_);
}

std::vector<ledger::upload::FileSummary> UploadService::FindUploadableFiles(const std::string& dataset_path,
                                                                            std::size_t max_files) {
  return InTransaction("UploadService.FindUploadableFiles", *repository_, [&](ledger::db::Transaction& tx) {
    return ledger::upload::DiscoveryQueries(*repository_).FindUploadableFiles(tx, dataset_path, max_files);
  });
}

std::vector<ledger::model::Algorithm> UploadService::FindAlgos(const std::string& dataset_path) {
  return InTransaction("UploadService.FindAlgos", *repository_, [&](ledger::db::Transaction& tx) {
    return ledger::upload::DiscoveryQueries(*repository_).FindAlgos(tx, dataset_path);
  });
}

void UploadService::UpdateFilesStatus(const std::vector<uint64_t>& file_ids, ledger::model::FileStatus status) {
  InTransaction("UploadService.UpdateFilesStatus", *repository_, [&](ledger::db::Transaction& tx) {
    ledger::upload::DiscoveryQueries(*repository_).UpdateFilesStatus(tx, file_ids, status);
  });
}

uint64_t UploadService::CountFiles() {
  return InTransaction("UploadService.CountFiles", *repository_, [&](ledger::db::Transaction& tx) {
    return ledger::upload::DiscoveryQueries(*repository_).CountFiles(tx);
  });
}

} // namespace ledger::service
