#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace ledger::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------
// Algorithms
// ---------------------------------------------------------------------

Result MemoryRepository::UpsertAlgorithm(Transaction& t, model::AlgorithmRow& row) {
  auto& s = TX(t).Mutable();
  for (const auto& [id, existing] : s.algorithms) {
    if (existing.algorithm.SameIdentity(row.algorithm)) {
      row.id = id;
      return Result::Ok();
    }
  }
  row.id                = s.next_algorithm_id++;
  s.algorithms[row.id] = row;
  return Result::Ok();
}

std::optional<model::AlgorithmRow> MemoryRepository::GetAlgorithm(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.algorithms.find(id);
  if (it == s.algorithms.end()) return std::nullopt;
  return it->second;
}

// ---------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------

Result MemoryRepository::InsertFile(Transaction& t, model::FileRow& row) {
  auto& s = TX(t).Mutable();
  if (s.lfn_to_id.contains(row.lfn)) return Result::Err(ErrorCode::AlreadyExists, "lfn " + row.lfn);
  if (!s.algorithms.contains(row.algorithm_id)) {
    return Result::Err(ErrorCode::NotFound, "algorithm id " + std::to_string(row.algorithm_id));
  }
  if (!row.block_name.empty() && !s.blocks.contains(row.block_name)) {
    return Result::Err(ErrorCode::NotFound, "block " + row.block_name);
  }
  if (row.created_at_ms == 0) row.created_at_ms = ledger::util::NowMillis();
  row.id             = s.next_file_id++;
  s.files[row.id]    = row;
  s.lfn_to_id[row.lfn] = row.id;
  return Result::Ok();
}

std::optional<model::FileRow> MemoryRepository::GetFileById(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.files.find(id);
  if (it == s.files.end()) return std::nullopt;
  return it->second;
}

std::optional<model::FileRow> MemoryRepository::GetFileByLfn(Transaction& t, const std::string& lfn) {
  const auto& s  = TX(t).View();
  auto        it = s.lfn_to_id.find(lfn);
  if (it == s.lfn_to_id.end()) return std::nullopt;
  return s.files.at(it->second);
}

Result MemoryRepository::DeleteFile(Transaction& t, uint64_t id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.files.find(id);
  if (it == s.files.end()) return Result::Err(ErrorCode::NotFound, "file id " + std::to_string(id));

  const std::string lfn = it->second.lfn;
  std::erase_if(s.lineage, [&](const auto& edge) { return edge.first == lfn || edge.second == lfn; });

  s.checksums.erase(id);
  s.runs.erase(id);
  s.file_locations.erase(id);
  s.lfn_to_id.erase(lfn);
  s.files.erase(it);
  return Result::Ok();
}

uint64_t MemoryRepository::CountFiles(Transaction& t) {
  return TX(t).View().files.size();
}

Result MemoryRepository::AddChecksums(Transaction& t, uint64_t file_id, const ledger::model::Checksums& checksums) {
  auto& s = TX(t).Mutable();
  if (!s.files.contains(file_id)) return Result::Err(ErrorCode::NotFound, "file id " + std::to_string(file_id));
  auto& stored = s.checksums[file_id];
  for (const auto& [algorithm, digest] : checksums) {
    stored[algorithm] = digest;
  }
  return Result::Ok();
}

ledger::model::Checksums MemoryRepository::GetChecksums(Transaction& t, uint64_t file_id) {
  const auto& s  = TX(t).View();
  auto        it = s.checksums.find(file_id);
  if (it == s.checksums.end()) return {};
  return it->second;
}

Result MemoryRepository::AddRuns(Transaction& t, uint64_t file_id, const ledger::model::RunSet& runs) {
  auto& s = TX(t).Mutable();
  if (!s.files.contains(file_id)) return Result::Err(ErrorCode::NotFound, "file id " + std::to_string(file_id));
  s.runs[file_id].Merge(runs);
  return Result::Ok();
}

ledger::model::RunSet MemoryRepository::GetRuns(Transaction& t, uint64_t file_id) {
  const auto& s  = TX(t).View();
  auto        it = s.runs.find(file_id);
  if (it == s.runs.end()) return {};
  return it->second;
}

// ---------------------------------------------------------------------
// Locations
// ---------------------------------------------------------------------

Result MemoryRepository::AddLocation(Transaction& t, const std::string& site) {
  TX(t).Mutable().sites.insert(site);
  return Result::Ok();
}

Result MemoryRepository::AddFileLocation(Transaction& t, uint64_t file_id, const std::string& site) {
  auto& s = TX(t).Mutable();
  if (!s.files.contains(file_id)) return Result::Err(ErrorCode::NotFound, "file id " + std::to_string(file_id));
  s.sites.insert(site);
  s.file_locations[file_id].insert(site);
  return Result::Ok();
}

ledger::model::SiteSet MemoryRepository::GetLocations(Transaction& t, uint64_t file_id) {
  const auto& s  = TX(t).View();
  auto        it = s.file_locations.find(file_id);
  if (it == s.file_locations.end()) return {};
  return it->second;
}

// ---------------------------------------------------------------------
// Lineage
// ---------------------------------------------------------------------

Result MemoryRepository::AddLineage(Transaction& t, const model::LineageRow& edge) {
  TX(t).Mutable().lineage.emplace(edge.parent_lfn, edge.child_lfn);
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::GetParents(Transaction& t, const std::string& child_lfn) {
  std::vector<std::string> out;
  for (const auto& [parent, child] : TX(t).View().lineage) {
    if (child == child_lfn) out.push_back(parent);
  }
  return out;
}

std::vector<std::string> MemoryRepository::GetChildren(Transaction& t, const std::string& parent_lfn) {
  const auto&              s = TX(t).View();
  std::vector<std::string> out;
  // edges are ordered by parent first
  for (auto it = s.lineage.lower_bound({parent_lfn, std::string()}); it != s.lineage.end() && it->first == parent_lfn;
       ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::vector<ledger::model::FileStatus> MemoryRepository::GetParentStatus(Transaction& t, const std::string& child_lfn) {
  const auto&                            s = TX(t).View();
  std::vector<std::pair<uint64_t, ledger::model::FileStatus>> tracked;
  for (const auto& [parent, child] : s.lineage) {
    if (child != child_lfn) continue;
    auto it = s.lfn_to_id.find(parent);
    if (it == s.lfn_to_id.end()) continue;
    tracked.emplace_back(it->second, s.files.at(it->second).status);
  }
  std::sort(tracked.begin(), tracked.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<ledger::model::FileStatus> out;
  out.reserve(tracked.size());
  for (const auto& [_, status] : tracked) out.push_back(status);
  return out;
}

// ---------------------------------------------------------------------
// Blocks
// ---------------------------------------------------------------------

Result MemoryRepository::SetBlockStatus(Transaction& t, const std::string& block, ledger::model::BlockStatus status) {
  auto& s  = TX(t).Mutable();
  auto  it = s.blocks.find(block);
  if (it == s.blocks.end()) {
    model::BlockRow row;
    row.name          = block;
    row.status        = status;
    row.created_at_ms = ledger::util::NowMillis();
    s.blocks.emplace(block, std::move(row));
  } else {
    it->second.status = status;
  }
  return Result::Ok();
}

Result MemoryRepository::AddBlockLocation(Transaction& t, const std::string& block, const std::string& site) {
  auto& s  = TX(t).Mutable();
  auto  it = s.blocks.find(block);
  if (it == s.blocks.end()) return Result::Err(ErrorCode::NotFound, "block " + block);
  s.sites.insert(site);
  it->second.locations.insert(site);
  return Result::Ok();
}

std::optional<model::BlockRow> MemoryRepository::GetBlockInfo(Transaction& t, const std::string& block) {
  const auto& s  = TX(t).View();
  auto        it = s.blocks.find(block);
  if (it == s.blocks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::SetBlock(Transaction& t, const std::string& lfn, const std::string& block) {
  auto& s  = TX(t).Mutable();
  auto  it = s.lfn_to_id.find(lfn);
  if (it == s.lfn_to_id.end()) return Result::Err(ErrorCode::NotFound, "lfn " + lfn);
  if (!s.blocks.contains(block)) return Result::Err(ErrorCode::NotFound, "block " + block);
  s.files[it->second].block_name = block;
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::GetBlock(Transaction& t, const std::string& lfn) {
  const auto& s  = TX(t).View();
  auto        it = s.lfn_to_id.find(lfn);
  if (it == s.lfn_to_id.end()) return std::nullopt;
  const auto& block = s.files.at(it->second).block_name;
  if (block.empty()) return std::nullopt;
  return block;
}

std::vector<std::string> MemoryRepository::GetBlockFiles(Transaction& t, const std::string& block) {
  std::vector<std::string> out;
  for (const auto& [_, row] : TX(t).View().files) {
    if (row.block_name == block) out.push_back(row.lfn);
  }
  return out;
}

// ---------------------------------------------------------------------
// Upload discovery
// ---------------------------------------------------------------------

std::vector<std::string> MemoryRepository::FindUploadableDatasets(Transaction& t) {
  std::set<std::string> datasets;
  for (const auto& [_, row] : TX(t).View().files) {
    if (row.status == ledger::model::FileStatus::kNotUploaded) datasets.insert(row.dataset_path);
  }
  return {datasets.begin(), datasets.end()};
}

std::vector<model::FileRow> MemoryRepository::FindUploadableFiles(Transaction& t, const std::string& dataset_path,
                                                                  std::size_t max_files) {
  std::vector<model::FileRow> out;
  for (const auto& [_, row] : TX(t).View().files) {
    if (out.size() >= max_files) break;
    if (row.dataset_path != dataset_path || row.status != ledger::model::FileStatus::kNotUploaded) continue;

    auto parents  = GetParentStatus(t, row.lfn);
    bool released = std::all_of(parents.begin(), parents.end(), ledger::model::IsInCatalog);
    if (released) out.push_back(row);
  }
  return out;
}

std::vector<model::AlgorithmRow> MemoryRepository::FindAlgos(Transaction& t, const std::string& dataset_path) {
  const auto&        s = TX(t).View();
  std::set<uint64_t> ids;
  for (const auto& [_, row] : s.files) {
    if (row.dataset_path == dataset_path) ids.insert(row.algorithm_id);
  }

  std::vector<model::AlgorithmRow> out;
  for (auto id : ids) {
    auto it = s.algorithms.find(id);
    if (it != s.algorithms.end()) out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::UpdateFileStatus(Transaction& t, uint64_t file_id, ledger::model::FileStatus status) {
  auto& s  = TX(t).Mutable();
  auto  it = s.files.find(file_id);
  if (it == s.files.end()) return Result::Err(ErrorCode::NotFound, "file id " + std::to_string(file_id));
  it->second.status = status;
  return Result::Ok();
}

} // namespace ledger::db::memory
