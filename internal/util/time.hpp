#pragma once

#include <chrono>
#include <cstdint>

namespace storykb::util {

/*
  Clock helpers.

  Wall clock for ledger timestamps, steady clock for deadlines.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock = std::chrono::steady_clock;
using Deadline    = SteadyClock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

Deadline                  DeadlineAfter(std::chrono::milliseconds timeout);
bool                      Expired(Deadline deadline);
std::chrono::milliseconds Remaining(Deadline deadline);

} // namespace storykb::util
