#pragma once

#include <chrono>
#include <cstdint>

namespace ledger::util {

/*
  Time utilities. Row timestamps are epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

inline uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

} // namespace ledger::util
