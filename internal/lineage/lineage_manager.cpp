#include "internal/lineage/lineage_manager.hpp"

#include <queue>
#include <unordered_set>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::lineage {

LineageManager::LineageManager(db::Repository& repo) : repo_(repo) {
}

void LineageManager::AddParents(db::Transaction& tx, const std::string& child_lfn,
                                const std::vector<std::string>& parent_lfns) {
  for (const auto& parent : parent_lfns) {
    AddEdge(tx, parent, child_lfn);
  }
}

void LineageManager::AddChildren(db::Transaction& tx, const std::string& parent_lfn,
                                 const std::vector<std::string>& child_lfns) {
  for (const auto& child : child_lfns) {
    AddEdge(tx, parent_lfn, child);
  }
}

void LineageManager::AddEdge(db::Transaction& tx, const std::string& parent_lfn, const std::string& child_lfn) {
  if (parent_lfn.empty() || child_lfn.empty()) {
    throw ledger::util::ValidationError("lineage edge needs both a parent and a child lfn");
  }
  if (parent_lfn == child_lfn) {
    throw ledger::util::ValidationError("file cannot be its own parent: " + child_lfn);
  }

  // parent -> child closes a cycle iff parent already descends from child
  for (const auto& descendant : GetDescendants(tx, child_lfn)) {
    if (descendant == parent_lfn) {
      throw ledger::util::ValidationError("lineage cycle: " + parent_lfn + " already descends from " + child_lfn);
    }
  }

  db::model::LineageRow edge;
  edge.parent_lfn    = parent_lfn;
  edge.child_lfn     = child_lfn;
  edge.created_at_ms = ledger::util::NowMillis();
  ledger::util::ThrowIfDbError(repo_.AddLineage(tx, edge), "add lineage " + parent_lfn + " -> " + child_lfn);
}

std::vector<std::string> LineageManager::GetParents(db::Transaction& tx, const std::string& lfn) {
  return repo_.GetParents(tx, lfn);
}

std::vector<std::string> LineageManager::GetChildren(db::Transaction& tx, const std::string& lfn) {
  return repo_.GetChildren(tx, lfn);
}

std::vector<ledger::model::FileStatus> LineageManager::GetParentStatus(db::Transaction& tx, const std::string& lfn) {
  return repo_.GetParentStatus(tx, lfn);
}

std::vector<std::string> LineageManager::GetAncestors(db::Transaction& tx, const std::string& lfn, uint32_t max_depth) {
  return Walk(tx, lfn, max_depth, true);
}

std::vector<std::string> LineageManager::GetDescendants(db::Transaction& tx, const std::string& lfn,
                                                        uint32_t max_depth) {
  return Walk(tx, lfn, max_depth, false);
}

std::vector<std::string> LineageManager::Walk(db::Transaction& tx, const std::string& lfn, uint32_t max_depth,
                                              bool upstream) {
  std::vector<std::string>                     out;
  std::queue<std::pair<std::string, uint32_t>> q;
  std::unordered_set<std::string>              visited;

  q.emplace(lfn, 0);
  visited.insert(lfn);

  while (!q.empty()) {
    const auto [node, depth] = q.front();
    q.pop();

    if (max_depth && depth >= max_depth) {
      continue;
    }

    const auto next = upstream ? repo_.GetParents(tx, node) : repo_.GetChildren(tx, node);
    for (const auto& neighbour : next) {
      if (visited.insert(neighbour).second) {
        out.push_back(neighbour);
        q.emplace(neighbour, depth + 1);
      }
    }
  }

  return out;
}

} // namespace ledger::lineage
