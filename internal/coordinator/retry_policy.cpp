#include "retry_policy.hpp"

#include <algorithm>
#include <thread>

namespace storykb::coordinator {

std::chrono::milliseconds RetryPolicy::BackoffFor(std::uint32_t attempt) const {
  double backoff = static_cast<double>(initial_backoff.count());
  for (std::uint32_t i = 1; i < attempt; ++i) {
    backoff *= multiplier;
    if (backoff >= static_cast<double>(max_backoff.count())) {
      return max_backoff;
    }
  }
  return std::min(max_backoff, std::chrono::milliseconds(static_cast<std::int64_t>(backoff)));
}

store::StoreStatus RunWithRetry(const RetryPolicy& policy, util::Deadline deadline, const std::function<store::StoreStatus()>& op,
                                std::uint32_t* attempts_out) {
  const auto max_attempts = std::max<std::uint32_t>(1, policy.max_attempts);

  store::StoreStatus status;
  std::uint32_t      attempt = 0;
  while (attempt < max_attempts) {
    ++attempt;
    status = op();
    if (status || !status.IsTransient()) {
      break;
    }
    if (attempt == max_attempts || util::Expired(deadline)) {
      break;
    }

    const auto backoff = policy.BackoffFor(attempt);
    if (backoff >= util::Remaining(deadline)) {
      // the next attempt could not finish in time anyway
      break;
    }
    std::this_thread::sleep_for(backoff);
  }

  if (attempts_out) *attempts_out = attempt;
  return status;
}

} // namespace storykb::coordinator
