#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "internal/store/store_status.hpp"
#include "internal/util/time.hpp"

namespace storykb::coordinator {

/*
  Bounded exponential backoff for adapter prepare calls.

  Only transient codes are retried, and never past the deadline: a sleep
  that would overrun it is cut short and the last status is returned.
*/
struct RetryPolicy {
  std::uint32_t             max_attempts    = 3;
  std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(20);
  std::chrono::milliseconds max_backoff     = std::chrono::milliseconds(500);
  double                    multiplier      = 2.0;

  // Backoff before attempt `attempt + 1` (attempt is 1-based).
  std::chrono::milliseconds BackoffFor(std::uint32_t attempt) const;
};

/*
  Calls `op` until it succeeds, fails permanently, runs out of attempts or
  the deadline passes. `attempts_out` receives the number of calls made.
*/
store::StoreStatus RunWithRetry(const RetryPolicy& policy, util::Deadline deadline, const std::function<store::StoreStatus()>& op,
                                std::uint32_t* attempts_out = nullptr);

} // namespace storykb::coordinator
