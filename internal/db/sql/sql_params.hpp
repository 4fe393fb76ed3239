#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace ledger::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding, so one parameter list serves both. The
  QueryCatalog rewrites ? into $n for Postgres once at startup.
*/

using Param = std::variant<
    std::nullptr_t,
    int64_t,
    uint64_t,
    std::string
>;

using Params = std::vector<Param>;

}
