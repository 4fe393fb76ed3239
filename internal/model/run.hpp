#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <set>

namespace ledger::model {

using RunNumber = std::uint32_t;
using LumiNumber = std::uint32_t;

struct Run {
  RunNumber run = 0;
  std::set<LumiNumber> lumis;

  Run() = default;
  Run(RunNumber number, std::initializer_list<LumiNumber> lumi_list) : run(number), lumis(lumi_list) {
  }
  Run(RunNumber number, std::set<LumiNumber> lumi_set) : run(number), lumis(std::move(lumi_set)) {
  }

  bool operator==(const Run&) const = default;
};

/*
  Run provenance of one file.

  Merge-only: adding a run that is already present unions its lumi
  sections instead of adding a second entry.
*/
class RunSet {
 public:
  using Map = std::map<RunNumber, std::set<LumiNumber>>;

  RunSet() = default;
  RunSet(std::initializer_list<Run> runs) {
    for (const auto& run : runs) Add(run);
  }

  void Add(const Run& run) {
    runs_[run.run].insert(run.lumis.begin(), run.lumis.end());
  }

  void Merge(const RunSet& other) {
    for (const auto& [number, lumis] : other.runs_) {
      runs_[number].insert(lumis.begin(), lumis.end());
    }
  }

  bool Contains(const Run& run) const {
    auto it = runs_.find(run.run);
    if (it == runs_.end()) return false;
    for (auto lumi : run.lumis) {
      if (!it->second.contains(lumi)) return false;
    }
    return true;
  }

  const std::set<LumiNumber>* Lumis(RunNumber number) const {
    auto it = runs_.find(number);
    return it == runs_.end() ? nullptr : &it->second;
  }

  const Map& runs() const {
    return runs_;
  }
  std::size_t size() const {
    return runs_.size();
  }
  bool empty() const {
    return runs_.empty();
  }

  Map::const_iterator begin() const {
    return runs_.begin();
  }
  Map::const_iterator end() const {
    return runs_.end();
  }

  bool operator==(const RunSet&) const = default;

 private:
  Map runs_;
};

}  // namespace ledger::model
