#pragma once

#include <map>
#include <set>
#include <string>

namespace ledger::model {

// Storage-site identifiers are opaque; only string equality matters.
using SiteSet = std::set<std::string>;

// algorithm name -> hex digest
using Checksums = std::map<std::string, std::string>;

}  // namespace ledger::model
