#pragma once

#include <cstdint>
#include <string>

#include "internal/model/file_status.hpp"

namespace ledger::db::model {

/*
  Persistent file row.

  Descriptor columns only. Checksums, runs, locations and lineage
  live in their own tables and are read through separate operations.
*/
struct FileRow {
  uint64_t    id = 0;  // 0 until inserted
  std::string lfn;

  uint64_t size_bytes = 0;
  uint64_t events     = 0;

  std::string dataset_path;
  uint64_t    algorithm_id = 0;

  ledger::model::FileStatus status = ledger::model::FileStatus::kNotUploaded;

  // empty = not assigned to a block
  std::string block_name;

  uint64_t created_at_ms = 0;
};

} // namespace ledger::db::model
