#pragma once

#include <cstdint>
#include <string>

#include "internal/model/file_status.hpp"
#include "internal/model/location.hpp"

namespace ledger::db::model {

struct BlockRow {
  std::string                name;
  ledger::model::BlockStatus status = ledger::model::BlockStatus::kOpen;
  ledger::model::SiteSet     locations;
  uint64_t                   created_at_ms = 0;
};

} // namespace ledger::db::model
