#pragma once

#include <cstdint>

#include "internal/model/algorithm.hpp"

namespace ledger::db::model {

struct AlgorithmRow {
  uint64_t                  id = 0;
  ledger::model::Algorithm algorithm;
};

} // namespace ledger::db::model
