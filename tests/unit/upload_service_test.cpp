#include "internal/service/upload_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/file_record.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using ledger::db::memory::MemoryRepository;
using ledger::service::UploadService;

constexpr const char* kDataset = "/MinimumBias/Run2009-v1/RAW";

void Populate(ledger::db::Repository& repo, int count) {
  auto tx = repo.Begin();
  for (int i = 0; i < count; ++i) {
    ledger::core::FileRecord file("/store/raw/" + std::to_string(i) + ".root", 2048, 50);
    file.SetAlgorithm("cmsRun", "CMSSW_3_3_0", "RAW", "HASH", "");
    file.SetDatasetPath(kDataset);
    file.Create(repo, *tx);
  }
  tx->Commit();
}

void TestDefaultPageSize() {
  auto repo = std::make_shared<MemoryRepository>();
  Populate(*repo, 15);

  UploadService service(repo);
  assert(service.FindUploadableFiles(kDataset).size() == 10);
  assert(service.FindUploadableFiles(kDataset, 12).size() == 12);

  UploadService small(repo, 4);
  assert(small.FindUploadableFiles(kDataset).size() == 4);
}

void TestUploadRoundTrip() {
  auto repo = std::make_shared<MemoryRepository>();
  Populate(*repo, 3);

  UploadService service(repo);
  assert(service.CountFiles() == 3);
  assert(service.FindUploadableDatasets() == std::vector<std::string>{kDataset});

  auto algos = service.FindAlgos(kDataset);
  assert(algos.size() == 1);
  assert(algos[0].app_version == "CMSSW_3_3_0");

  std::vector<uint64_t> ids;
  for (const auto& f : service.FindUploadableFiles(kDataset)) ids.push_back(f.id);
  service.UpdateFilesStatus(ids);

  assert(service.FindUploadableFiles(kDataset).empty());
  assert(service.FindUploadableDatasets().empty());
  assert(service.CountFiles() == 3);
}

void TestFailedUpdateIsRolledBack() {
  auto repo = std::make_shared<MemoryRepository>();
  Populate(*repo, 2);

  UploadService service(repo);
  auto          files = service.FindUploadableFiles(kDataset);
  assert(files.size() == 2);

  bool threw = false;
  try {
    service.UpdateFilesStatus({files[0].id, 777});
  } catch (const ledger::util::NotFoundError&) {
    threw = true;
  }
  assert(threw);
  assert(service.FindUploadableFiles(kDataset).size() == 2);
}

void TestNullRepositoryIsRejected() {
  bool threw = false;
  try {
    UploadService service(nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaultPageSize();
  TestUploadRoundTrip();
  TestFailedUpdateIsRolledBack();
  TestNullRepositoryIsRejected();

  std::cout << "ledger_unit_upload_service: pass\n";
  return 0;
}
