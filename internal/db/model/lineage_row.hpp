#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

/*
  Lineage edge keyed by LFN.

  Neither side has to be a tracked file: parents are often declared
  before (or without) being inserted, and get resolved on load.

  parent ---> child
*/
struct LineageRow {
  std::string parent_lfn;
  std::string child_lfn;

  // event timestamp (epoch ms)
  uint64_t created_at_ms = 0;
};

} // namespace ledger::db::model
