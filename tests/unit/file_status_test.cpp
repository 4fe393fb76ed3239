#include "internal/model/file_status.hpp"

#include <cassert>
#include <iostream>

namespace {

using ledger::model::BlockStatus;
using ledger::model::FileStatus;

void TestFileStatusTextRoundTrip() {
  for (auto status : {FileStatus::kNotUploaded, FileStatus::kUploaded, FileStatus::kAlreadyInCatalog}) {
    auto parsed = ledger::model::ParseFileStatus(ledger::model::ToString(status));
    assert(parsed.has_value());
    assert(*parsed == status);
  }
  assert(!ledger::model::ParseFileStatus("uploaded").has_value());
  assert(!ledger::model::ParseFileStatus("").has_value());
}

void TestBlockStatusParsing() {
  assert(ledger::model::ParseBlockStatus("OPEN") == BlockStatus::kOpen);
  assert(ledger::model::ParseBlockStatus("PENDING") == BlockStatus::kPending);
  assert(ledger::model::ParseBlockStatus("CLOSED") == BlockStatus::kClosed);
  assert(!ledger::model::ParseBlockStatus("Open").has_value());
}

void TestOnlyCatalogStatesReleaseChildren() {
  static_assert(ledger::model::IsInCatalog(FileStatus::kUploaded));
  static_assert(ledger::model::IsInCatalog(FileStatus::kAlreadyInCatalog));
  static_assert(!ledger::model::IsInCatalog(FileStatus::kNotUploaded));
}

} // namespace

int main() {
  TestFileStatusTextRoundTrip();
  TestBlockStatusParsing();
  TestOnlyCatalogStatesReleaseChildren();

  std::cout << "ledger_unit_file_status: pass\n";
  return 0;
}
