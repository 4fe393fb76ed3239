#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/file_status.hpp"
#include "internal/model/location.hpp"

namespace ledger::block {

struct BlockInfo {
  std::string                name;
  ledger::model::BlockStatus status = ledger::model::BlockStatus::kOpen;
  ledger::model::SiteSet     locations;
};

/*
  Groups files into named upload units.

  A block comes into existence on first use, either through
  SetBlockStatus() or when SetBlock() names a block that is not stored
  yet (status OPEN, no locations). Blocks may stay empty.
*/
class BlockManager {
 public:
  explicit BlockManager(db::Repository& repo);

  // Throws util::NotFoundError when no file has this LFN.
  void SetBlock(db::Transaction& tx, const std::string& lfn, const std::string& block);

  // nullopt when the file is not in a block. Throws util::NotFoundError
  // when no file has this LFN.
  std::optional<std::string> GetBlock(db::Transaction& tx, const std::string& lfn);

  // Creates or updates the block and adds the sites to its locations.
  void SetBlockStatus(db::Transaction& tx, const std::string& block, const ledger::model::SiteSet& locations,
                      ledger::model::BlockStatus status = ledger::model::BlockStatus::kOpen);

  std::optional<BlockInfo> GetBlockInfo(db::Transaction& tx, const std::string& block);

  std::vector<std::string> ListBlockFiles(db::Transaction& tx, const std::string& block);

 private:
  db::Repository& repo_;
};

} // namespace ledger::block
