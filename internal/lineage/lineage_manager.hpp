#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/file_status.hpp"

namespace ledger::lineage {

/*
  Parent/child edges between files, keyed by LFN.

  Either end of an edge may be an LFN that is not (yet) tracked; the
  edge is stored as given and picked up once a file with that LFN is
  created. Edges that would make a file its own ancestor are rejected
  with util::ValidationError.
*/
class LineageManager {
 public:
  explicit LineageManager(db::Repository& repo);

  void AddParents(db::Transaction& tx, const std::string& child_lfn, const std::vector<std::string>& parent_lfns);
  void AddChildren(db::Transaction& tx, const std::string& parent_lfn, const std::vector<std::string>& child_lfns);

  std::vector<std::string> GetParents(db::Transaction& tx, const std::string& lfn);
  std::vector<std::string> GetChildren(db::Transaction& tx, const std::string& lfn);

  // Upload status of every tracked parent. Untracked parents are skipped.
  std::vector<ledger::model::FileStatus> GetParentStatus(db::Transaction& tx, const std::string& lfn);

  // Breadth-first, nearest first. max_depth 0 walks the whole graph.
  std::vector<std::string> GetAncestors(db::Transaction& tx, const std::string& lfn, uint32_t max_depth = 0);
  std::vector<std::string> GetDescendants(db::Transaction& tx, const std::string& lfn, uint32_t max_depth = 0);

 private:
  void AddEdge(db::Transaction& tx, const std::string& parent_lfn, const std::string& child_lfn);
  std::vector<std::string> Walk(db::Transaction& tx, const std::string& lfn, uint32_t max_depth, bool upstream);

  db::Repository& repo_;
};

} // namespace ledger::lineage
