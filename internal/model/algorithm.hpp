#pragma once

#include <string>
#include <tuple>

namespace ledger::model {

/*
  Producing application of a file.

  Identity is (app_name, app_version, app_family, pset_hash); files
  sharing the tuple share one stored algorithm row. config_content is
  carried along but is not part of the identity.
*/
struct Algorithm {
  std::string app_name;
  std::string app_version;
  std::string app_family;
  std::string pset_hash;
  std::string config_content;

  bool IsSet() const {
    return !app_name.empty() && !app_version.empty() && !app_family.empty() && !pset_hash.empty();
  }

  auto Key() const {
    return std::tie(app_name, app_version, app_family, pset_hash);
  }

  bool SameIdentity(const Algorithm& other) const {
    return Key() == other.Key();
  }

  bool operator==(const Algorithm&) const = default;
};

}  // namespace ledger::model
