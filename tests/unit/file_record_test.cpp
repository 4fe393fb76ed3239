#include "internal/core/file_record.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/location/location_manager.hpp"
#include "internal/util/errors.hpp"

namespace {

using ledger::core::FileRecord;
using ledger::db::memory::MemoryRepository;
using ledger::model::Run;
using ledger::model::RunSet;
using ledger::model::SiteSet;

constexpr const char* kDataset = "/Cosmics/CRUZET09-PromptReco-v1/RECO";

std::shared_ptr<MemoryRepository> MakeRepository() {
  auto repo = std::make_shared<MemoryRepository>();
  auto tx   = repo->Begin();
  ledger::location::LocationManager(*repo).EnsureSites(*tx, {"se1.cern.ch", "se1.fnal.gov"});
  tx->Commit();
  return repo;
}

FileRecord MakeFile(const std::string& lfn, uint64_t size = 1024, uint64_t events = 10) {
  FileRecord file(lfn, size, events, {{"cksum", "1"}});
  file.SetAlgorithm("cmsRun", "CMSSW_2_1_8", "RECO", "GIBBERISH", "MOREGIBBERISH");
  file.SetDatasetPath(kDataset);
  return file;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCreateDeleteExists() {
  auto repo = MakeRepository();
  auto file = MakeFile("/this/is/a/lfn");

  auto tx = repo->Begin();
  assert(!file.Exists(*repo, *tx).has_value());
  file.Create(*repo, *tx);
  assert(file.id().has_value());
  assert(file.Exists(*repo, *tx) == file.id());

  file.Delete(*repo, *tx);
  assert(!file.Exists(*repo, *tx).has_value());
  tx->Commit();
}

void TestCreateRolledBackIsInvisible() {
  auto repo = MakeRepository();
  auto file = MakeFile("/this/is/a/lfn");

  {
    auto tx = repo->Begin();
    file.Create(*repo, *tx);
    assert(file.Exists(*repo, *tx).has_value());
    tx->Rollback();
  }

  auto tx = repo->Begin();
  assert(!file.Exists(*repo, *tx).has_value());
}

void TestDeleteRolledBackKeepsFile() {
  auto repo = MakeRepository();
  auto file = MakeFile("/this/is/a/lfn");
  {
    auto tx = repo->Begin();
    file.Create(*repo, *tx);
    tx->Commit();
  }
  {
    auto tx = repo->Begin();
    file.Delete(*repo, *tx);
    assert(!file.Exists(*repo, *tx).has_value());
    tx->Rollback();
  }

  auto tx = repo->Begin();
  assert(file.Exists(*repo, *tx).has_value());
}

void TestCreateRequiresDescriptors() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  FileRecord no_algo("/no/algo", 1, 1);
  no_algo.SetDatasetPath(kDataset);
  assert(Throws<ledger::util::ValidationError>([&] { no_algo.Create(*repo, *tx); }));

  FileRecord no_dataset("/no/dataset", 1, 1);
  no_dataset.SetAlgorithm("cmsRun", "CMSSW_2_1_8", "RECO", "GIBBERISH", "");
  assert(Throws<ledger::util::ValidationError>([&] { no_dataset.Create(*repo, *tx); }));

  FileRecord no_lfn;
  assert(Throws<ledger::util::ValidationError>([&] { no_lfn.Create(*repo, *tx); }));
  assert(repo->CountFiles(*tx) == 0);
}

void TestDuplicateLfnIsRejected() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  auto first = MakeFile("/dup/lfn");
  first.Create(*repo, *tx);

  auto second = MakeFile("/dup/lfn", 99, 99);
  assert(Throws<ledger::util::DuplicateError>([&] { second.Create(*repo, *tx); }));
  assert(repo->CountFiles(*tx) == 1);
}

void TestDeleteMissingIsNotFound() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();
  auto file = MakeFile("/never/created");
  assert(Throws<ledger::util::NotFoundError>([&] { file.Delete(*repo, *tx); }));
}

void TestLoadRestoresEverything() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  FileRecord file("/this/is/a/lfn", 1024, 10, {{"cksum", "1"}, {"adler32", "deadbeef"}}, "se1.fnal.gov");
  file.SetAlgorithm("cmsRun", "CMSSW_2_1_8", "RECO", "GIBBERISH", "MOREGIBBERISH");
  file.SetDatasetPath(kDataset);
  file.AddRun(Run(1, {45}));
  file.AddRun(Run(2, {46, 47}));
  file.Create(*repo, *tx);

  auto by_id = FileRecord::WithId(*file.id());
  by_id.Load(*repo, *tx);
  assert(by_id == file);
  assert(by_id.lfn() == "/this/is/a/lfn");
  assert(by_id.status() == ledger::model::FileStatus::kNotUploaded);
  assert(!by_id.block().has_value());

  FileRecord by_lfn("/this/is/a/lfn");
  by_lfn.Load(*repo, *tx);
  assert(by_lfn == file);
  assert(by_lfn.algorithm().config_content == "MOREGIBBERISH");

  FileRecord missing("/not/there");
  assert(Throws<ledger::util::NotFoundError>([&] { missing.Load(*repo, *tx); }));
}

void TestLoadWithParentage() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  auto parent_a = MakeFile("/parent/a");
  auto parent_b = MakeFile("/parent/b", 2048, 20);
  parent_a.Create(*repo, *tx);
  parent_b.Create(*repo, *tx);

  auto child = MakeFile("/child");
  child.Create(*repo, *tx);
  child.AddParents(*repo, *tx, {"/parent/a", "/parent/b", "/parent/untracked"});

  FileRecord loaded("/child");
  loaded.Load(*repo, *tx, true);
  assert(loaded == child);
  assert(loaded.parent_lfns() == (std::set<std::string>{"/parent/a", "/parent/b", "/parent/untracked"}));
  assert(loaded.parents().size() == 3);

  int tracked = 0;
  for (const auto& parent : loaded.parents()) {
    if (parent.lfn() == "/parent/a") {
      assert(parent == parent_a);
      ++tracked;
    } else if (parent.lfn() == "/parent/b") {
      assert(parent == parent_b);
      ++tracked;
    } else {
      assert(parent.lfn() == "/parent/untracked");
      assert(!parent.id().has_value());
    }
  }
  assert(tracked == 2);

  FileRecord shallow("/child");
  shallow.Load(*repo, *tx);
  assert(shallow.parents().empty());
  assert(shallow.parent_lfns().size() == 3);
}

void TestParentsDeclaredBeforeTheyExist() {
  auto repo = MakeRepository();
  {
    auto tx    = repo->Begin();
    auto child = MakeFile("/late/child");
    child.Create(*repo, *tx);
    child.AddParents(*repo, *tx, {"/late/a", "/late/b", "/late/c"});
    tx->Commit();
  }

  for (const char* lfn : {"/late/a", "/late/b", "/late/c"}) {
    auto tx     = repo->Begin();
    auto parent = MakeFile(lfn);
    parent.Create(*repo, *tx);
    tx->Commit();
  }

  auto       tx = repo->Begin();
  FileRecord loaded("/late/child");
  loaded.Load(*repo, *tx, true);
  assert(loaded.parents().size() == 3);
  for (const auto& parent : loaded.parents()) {
    assert(parent.id().has_value());
    assert(parent.dataset_path() == kDataset);
  }
  assert(loaded.GetParentLFNs(*repo, *tx) == (std::set<std::string>{"/late/a", "/late/b", "/late/c"}));
}

void TestGetParentLfnsIncludesUntracked() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  auto parent = MakeFile("/parent/one");
  parent.Create(*repo, *tx);
  auto child = MakeFile("/child/one");
  child.Create(*repo, *tx);

  child.AddParents(*repo, *tx, {"/parent/one", "/parent/not/stored"});
  // repeated edges are stored once
  child.AddParents(*repo, *tx, {"/parent/one"});

  FileRecord fresh("/child/one");
  auto       lfns = fresh.GetParentLFNs(*repo, *tx);
  assert(lfns == (std::set<std::string>{"/parent/one", "/parent/not/stored"}));

  auto by_id = FileRecord::WithId(*child.id());
  assert(by_id.GetParentLFNs(*repo, *tx) == lfns);
}

void TestAddChildren() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  auto parent = MakeFile("/parent");
  parent.Create(*repo, *tx);
  auto child = MakeFile("/child");
  child.Create(*repo, *tx);

  parent.AddChildren(*repo, *tx, "/child");
  assert(parent.child_lfns() == (std::set<std::string>{"/child"}));
  assert(child.GetParentLFNs(*repo, *tx) == (std::set<std::string>{"/parent"}));
  tx->Commit();
}

void TestAddChildrenRolledBack() {
  auto repo = MakeRepository();
  auto parent = MakeFile("/parent");
  auto child  = MakeFile("/child");
  {
    auto tx = repo->Begin();
    parent.Create(*repo, *tx);
    child.Create(*repo, *tx);
    tx->Commit();
  }
  {
    auto tx = repo->Begin();
    parent.AddChildren(*repo, *tx, std::vector<std::string>{"/child"});
    assert(child.GetParentLFNs(*repo, *tx).size() == 1);
    tx->Rollback();
  }

  auto tx = repo->Begin();
  assert(child.GetParentLFNs(*repo, *tx).empty());
}

void TestSelfParentIsRejected() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();
  auto file = MakeFile("/loop");
  file.Create(*repo, *tx);
  assert(Throws<ledger::util::ValidationError>([&] { file.AddParents(*repo, *tx, {"/loop"}); }));
}

void TestSetLocation() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  auto file = MakeFile("/located");
  file.Create(*repo, *tx);
  file.SetLocation(*repo, *tx, "se1.fnal.gov");
  file.SetLocation(*repo, *tx, SiteSet{"se1.cern.ch", "se1.fnal.gov"});
  assert(file.locations() == (SiteSet{"se1.cern.ch", "se1.fnal.gov"}));

  FileRecord loaded("/located");
  loaded.Load(*repo, *tx);
  assert(loaded.locations() == (SiteSet{"se1.cern.ch", "se1.fnal.gov"}));

  // unregistered sites are registered on the way
  file.SetLocation(*repo, *tx, "se2.desy.de");
  loaded.Load(*repo, *tx);
  assert(loaded.locations().size() == 3);
  tx->Commit();
}

void TestSetLocationRolledBack() {
  auto repo = MakeRepository();
  auto file = MakeFile("/located");
  {
    auto tx = repo->Begin();
    file.Create(*repo, *tx);
    file.SetLocation(*repo, *tx, "se1.fnal.gov");
    tx->Commit();
  }
  {
    auto tx = repo->Begin();
    file.SetLocation(*repo, *tx, "se1.cern.ch");
    tx->Rollback();
  }

  auto       tx = repo->Begin();
  FileRecord loaded("/located");
  loaded.Load(*repo, *tx);
  assert(loaded.locations() == SiteSet{"se1.fnal.gov"});
}

void TestSetLocationOnMissingFile() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();
  auto file = MakeFile("/not/created");
  assert(Throws<ledger::util::NotFoundError>([&] { file.SetLocation(*repo, *tx, "se1.cern.ch"); }));
}

void TestConstructorLocationsAreStoredOnCreate() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  FileRecord file("/this/is/a/lfn", 1024, 10, {{"cksum", "1"}}, "se1.fnal.gov");
  file.SetAlgorithm("cmsRun", "CMSSW_2_1_8", "RECO", "GIBBERISH", "MOREGIBBERISH");
  file.SetDatasetPath(kDataset);
  assert(file.pending_locations() == SiteSet{"se1.fnal.gov"});

  file.Create(*repo, *tx);
  assert(file.pending_locations().empty());

  FileRecord loaded("/this/is/a/lfn");
  loaded.Load(*repo, *tx);
  assert(loaded.locations() == SiteSet{"se1.fnal.gov"});
  tx->Commit();
}

void TestDeferredLocationsFlush() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  auto file = MakeFile("/deferred");
  file.Create(*repo, *tx);

  auto pending = file.DeferLocation(SiteSet{"se1.cern.ch", "se1.fnal.gov"});
  assert(pending.sites().size() == 2);
  assert(file.locations().size() == 2);
  assert(repo->GetLocations(*tx, *file.id()).empty());

  pending.Flush(*repo, *tx);
  assert(pending.settled());
  assert(file.pending_locations().empty());
  assert(repo->GetLocations(*tx, *file.id()) == (SiteSet{"se1.cern.ch", "se1.fnal.gov"}));
  tx->Commit();
}

void TestDeferredLocationsDiscard() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  auto file = MakeFile("/deferred");
  file.Create(*repo, *tx);
  file.SetLocation(*repo, *tx, "se1.fnal.gov");

  auto pending = file.DeferLocation(SiteSet{"se1.cern.ch", "se1.fnal.gov"});
  // already known sites are not buffered again
  assert(pending.sites() == SiteSet{"se1.cern.ch"});

  pending.Discard();
  assert(pending.settled());
  assert(file.locations() == SiteSet{"se1.fnal.gov"});
  assert(file.pending_locations().empty());

  // settled handles ignore further calls
  pending.Flush(*repo, *tx);
  assert(repo->GetLocations(*tx, *file.id()) == SiteSet{"se1.fnal.gov"});
}

void TestUnsettledDeferredLocationsStayBuffered() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  auto file = MakeFile("/deferred");
  file.Create(*repo, *tx);
  {
    auto pending = file.DeferLocation("se1.cern.ch");
    auto moved   = std::move(pending);
    assert(pending.settled());
    assert(!moved.settled());
  }
  assert(file.pending_locations() == SiteSet{"se1.cern.ch"});
  assert(repo->GetLocations(*tx, *file.id()).empty());

  // the next immediate write takes the buffered site along
  file.SetLocation(*repo, *tx, "se1.fnal.gov");
  assert(file.pending_locations().empty());
  assert(repo->GetLocations(*tx, *file.id()) == (SiteSet{"se1.cern.ch", "se1.fnal.gov"}));
  tx->Commit();
}

void TestDeferredLocationsFollowMovedRecord() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  auto file = MakeFile("/deferred/moved");
  file.Create(*repo, *tx);
  const auto id = *file.id();

  auto pending = file.DeferLocation("se1.cern.ch");

  std::vector<FileRecord> records;
  records.push_back(std::move(file));
  // force the vector to relocate its element as well
  records.reserve(16);

  pending.Flush(*repo, *tx);
  assert(pending.settled());
  assert(records.front().pending_locations().empty());
  assert(records.front().locations() == SiteSet{"se1.cern.ch"});
  assert(repo->GetLocations(*tx, id) == SiteSet{"se1.cern.ch"});
  tx->Commit();
}

void TestDeferredLocationsOutliveRecord() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  uint64_t id = 0;
  auto     pending = [&] {
    auto file = MakeFile("/deferred/gone");
    file.Create(*repo, *tx);
    id = *file.id();
    return file.DeferLocation(SiteSet{"se1.cern.ch", "se1.fnal.gov"});
  }();

  pending.Flush(*repo, *tx);
  assert(repo->GetLocations(*tx, id) == (SiteSet{"se1.cern.ch", "se1.fnal.gov"}));
}

void TestDeferredLocationsOnCopiedRecord() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  auto file = MakeFile("/deferred/copied");
  file.Create(*repo, *tx);

  auto       pending = file.DeferLocation("se1.cern.ch");
  FileRecord copy    = file;
  assert(copy.pending_locations() == SiteSet{"se1.cern.ch"});

  // the handle belongs to the original; the copy keeps its own buffer
  pending.Discard();
  assert(file.pending_locations().empty());
  assert(file.locations().empty());
  assert(copy.pending_locations() == SiteSet{"se1.cern.ch"});

  copy.FlushLocations(*repo, *tx);
  assert(copy.pending_locations().empty());
  assert(repo->GetLocations(*tx, *file.id()) == SiteSet{"se1.cern.ch"});
}

void TestFlushBeforeCreateIsNotFound() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  auto file    = MakeFile("/deferred/not/created");
  auto pending = file.DeferLocation("se1.cern.ch");
  assert(Throws<ledger::util::NotFoundError>([&] { pending.Flush(*repo, *tx); }));
  assert(!pending.settled());

  // the buffered site is written by Create
  file.Create(*repo, *tx);
  pending.Flush(*repo, *tx);
  assert(pending.settled());
  assert(repo->GetLocations(*tx, *file.id()) == SiteSet{"se1.cern.ch"});
}

void TestAddRunSet() {
  auto repo = MakeRepository();
  auto tx   = repo->Begin();

  auto file = MakeFile("/runs");
  file.AddRunSet(RunSet{Run(1, {45, 46}), Run(1, {47})});
  assert(file.runs().size() == 1);
  file.Create(*repo, *tx);

  file.AddRunSet(*repo, *tx, RunSet{Run(1, {48}), Run(2, {1})});

  FileRecord loaded("/runs");
  loaded.Load(*repo, *tx);
  assert(loaded.runs() == (RunSet{Run(1, {45, 46, 47, 48}), Run(2, {1})}));
  assert(loaded.runs() == file.runs());
  tx->Commit();
}

void TestCopiesCompareEqual() {
  auto a = MakeFile("/same");
  auto b = a;
  assert(a == b);
  b.AddRun(Run(7, {1}));
  assert(!(a == b));
}

} // namespace

int main() {
  TestCreateDeleteExists();
  TestCreateRolledBackIsInvisible();
  TestDeleteRolledBackKeepsFile();
  TestCreateRequiresDescriptors();
  TestDuplicateLfnIsRejected();
  TestDeleteMissingIsNotFound();
  TestLoadRestoresEverything();
  TestLoadWithParentage();
  TestParentsDeclaredBeforeTheyExist();
  TestGetParentLfnsIncludesUntracked();
  TestAddChildren();
  TestAddChildrenRolledBack();
  TestSelfParentIsRejected();
  TestSetLocation();
  TestSetLocationRolledBack();
  TestSetLocationOnMissingFile();
  TestConstructorLocationsAreStoredOnCreate();
  TestDeferredLocationsFlush();
  TestDeferredLocationsDiscard();
  TestUnsettledDeferredLocationsStayBuffered();
  TestDeferredLocationsFollowMovedRecord();
  TestDeferredLocationsOutliveRecord();
  TestDeferredLocationsOnCopiedRecord();
  TestFlushBeforeCreateIsNotFound();
  TestAddRunSet();
  TestCopiesCompareEqual();

  std::cout << "ledger_unit_file_record: pass\n";
  return 0;
}
