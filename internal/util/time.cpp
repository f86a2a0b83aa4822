#include "time.hpp"

namespace storykb::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

Deadline DeadlineAfter(std::chrono::milliseconds timeout) {
  return SteadyClock::now() + timeout;
}

bool Expired(Deadline deadline) {
  return SteadyClock::now() >= deadline;
}

std::chrono::milliseconds Remaining(Deadline deadline) {
  const auto now = SteadyClock::now();
  if (now >= deadline) return std::chrono::milliseconds(0);
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

} // namespace storykb::util
