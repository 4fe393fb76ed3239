#include "internal/block/block_manager.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::block {

BlockManager::BlockManager(db::Repository& repo) : repo_(repo) {
}

void BlockManager::SetBlock(db::Transaction& tx, const std::string& lfn, const std::string& block) {
  if (block.empty()) {
    throw ledger::util::ValidationError("block name must not be empty");
  }
  if (!repo_.GetFileByLfn(tx, lfn)) {
    throw ledger::util::NotFoundError("set block: no file " + lfn);
  }
  if (!repo_.GetBlockInfo(tx, block)) {
    ledger::util::ThrowIfDbError(repo_.SetBlockStatus(tx, block, ledger::model::BlockStatus::kOpen),
                                 "create block " + block);
  }
  ledger::util::ThrowIfDbError(repo_.SetBlock(tx, lfn, block), "set block " + block);
}

std::optional<std::string> BlockManager::GetBlock(db::Transaction& tx, const std::string& lfn) {
  if (!repo_.GetFileByLfn(tx, lfn)) {
    throw ledger::util::NotFoundError("get block: no file " + lfn);
  }
  return repo_.GetBlock(tx, lfn);
}

void BlockManager::SetBlockStatus(db::Transaction& tx, const std::string& block, const ledger::model::SiteSet& locations,
                                  ledger::model::BlockStatus status) {
  if (block.empty()) {
    throw ledger::util::ValidationError("block name must not be empty");
  }
  ledger::util::ThrowIfDbError(repo_.SetBlockStatus(tx, block, status), "set block status " + block);
  for (const auto& site : locations) {
    ledger::util::ThrowIfDbError(repo_.AddBlockLocation(tx, block, site), "add block location " + site);
  }

  LEDGER_LOG_DEBUG("Block status set", {ledger::observability::StringField("block", block),
                                        ledger::observability::StringField("status", ledger::model::ToString(status)),
                                        ledger::observability::IntField("sites", static_cast<int64_t>(locations.size()))});
}

std::optional<BlockInfo> BlockManager::GetBlockInfo(db::Transaction& tx, const std::string& block) {
  auto row = repo_.GetBlockInfo(tx, block);
  if (!row) {
    return std::nullopt;
  }
  return BlockInfo{row->name, row->status, row->locations};
}

std::vector<std::string> BlockManager::ListBlockFiles(db::Transaction& tx, const std::string& block) {
  return repo_.GetBlockFiles(tx, block);
}

} // namespace ledger::block
