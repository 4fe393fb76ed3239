#include "internal/block/block_manager.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/core/file_record.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using ledger::block::BlockManager;
using ledger::db::memory::MemoryRepository;
using ledger::model::BlockStatus;
using ledger::model::SiteSet;

void CreateFile(ledger::db::Repository& repo, ledger::db::Transaction& tx, const std::string& lfn) {
  ledger::core::FileRecord file(lfn, 1024, 10, {{"cksum", "1"}}, "se1.fnal.gov");
  file.SetAlgorithm("cmsRun", "CMSSW_2_1_8", "RECO", "GIBBERISH", "MOREGIBBERISH");
  file.SetDatasetPath("/Cosmics/CRUZET09-PromptReco-v1/RECO");
  file.Create(repo, tx);
}

void TestSetBlock() {
  MemoryRepository repo;
  BlockManager     blocks(repo);
  auto             tx = repo.Begin();

  CreateFile(repo, *tx, "/this/is/a/lfn");
  CreateFile(repo, *tx, "/this/is/another/lfn");

  blocks.SetBlockStatus(*tx, "someblockname", {"se1.cern.ch"});
  blocks.SetBlock(*tx, "/this/is/a/lfn", "someblockname");

  assert(blocks.GetBlock(*tx, "/this/is/a/lfn") == std::optional<std::string>("someblockname"));
  assert(!blocks.GetBlock(*tx, "/this/is/another/lfn").has_value());

  ledger::core::FileRecord loaded("/this/is/a/lfn");
  loaded.Load(repo, *tx);
  assert(loaded.block() == std::optional<std::string>("someblockname"));

  assert(blocks.ListBlockFiles(*tx, "someblockname") == std::vector<std::string>{"/this/is/a/lfn"});
  tx->Commit();
}

void TestSetBlockCreatesOpenBlock() {
  MemoryRepository repo;
  BlockManager     blocks(repo);
  auto             tx = repo.Begin();

  CreateFile(repo, *tx, "/implicit");
  assert(!blocks.GetBlockInfo(*tx, "fresh").has_value());

  blocks.SetBlock(*tx, "/implicit", "fresh");

  auto info = blocks.GetBlockInfo(*tx, "fresh");
  assert(info.has_value());
  assert(info->name == "fresh");
  assert(info->status == BlockStatus::kOpen);
  assert(info->locations.empty());

  // moving to another block replaces the assignment
  blocks.SetBlock(*tx, "/implicit", "other");
  assert(blocks.GetBlock(*tx, "/implicit") == std::optional<std::string>("other"));
  assert(blocks.ListBlockFiles(*tx, "fresh").empty());
}

void TestBlockStatusUpdatesAndLocationsAccumulate() {
  MemoryRepository repo;
  BlockManager     blocks(repo);
  auto             tx = repo.Begin();

  blocks.SetBlockStatus(*tx, "b1", {"se1.cern.ch"});
  blocks.SetBlockStatus(*tx, "b1", {"se1.fnal.gov"}, BlockStatus::kPending);
  blocks.SetBlockStatus(*tx, "b1", {}, BlockStatus::kClosed);

  auto info = blocks.GetBlockInfo(*tx, "b1");
  assert(info.has_value());
  assert(info->status == BlockStatus::kClosed);
  assert(info->locations == (SiteSet{"se1.cern.ch", "se1.fnal.gov"}));
}

void TestUnknownFileIsNotFound() {
  MemoryRepository repo;
  BlockManager     blocks(repo);
  auto             tx = repo.Begin();

  bool threw = false;
  try {
    blocks.SetBlock(*tx, "/missing", "someblockname");
  } catch (const ledger::util::NotFoundError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)blocks.GetBlock(*tx, "/missing");
  } catch (const ledger::util::NotFoundError&) {
    threw = true;
  }
  assert(threw);

  // nothing was created on the failed call
  assert(!blocks.GetBlockInfo(*tx, "someblockname").has_value());
}

void TestEmptyBlockNameIsRejected() {
  MemoryRepository repo;
  BlockManager     blocks(repo);
  auto             tx = repo.Begin();
  CreateFile(repo, *tx, "/named");

  bool threw = false;
  try {
    blocks.SetBlock(*tx, "/named", "");
  } catch (const ledger::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    blocks.SetBlockStatus(*tx, "", {"se1.cern.ch"});
  } catch (const ledger::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestRolledBackBlockIsInvisible() {
  MemoryRepository repo;
  BlockManager     blocks(repo);
  {
    auto tx = repo.Begin();
    CreateFile(repo, *tx, "/kept");
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    blocks.SetBlockStatus(*tx, "temp", {"se1.cern.ch"});
    blocks.SetBlock(*tx, "/kept", "temp");
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(!blocks.GetBlockInfo(*tx, "temp").has_value());
  assert(!blocks.GetBlock(*tx, "/kept").has_value());
}

} // namespace

int main() {
  TestSetBlock();
  TestSetBlockCreatesOpenBlock();
  TestBlockStatusUpdatesAndLocationsAccumulate();
  TestUnknownFileIsNotFound();
  TestEmptyBlockNameIsRejected();
  TestRolledBackBlockIsInvisible();

  std::cout << "ledger_unit_block_manager: pass\n";
  return 0;
}
