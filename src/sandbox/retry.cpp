#include "sandrun/sandbox/retry.hpp"

#include <thread>

namespace sandrun::sandbox {

RetryResult retry(const RetryPolicy &policy, const RetryAttempt &attempt,
                  const common::CancelScope *cancel) {
  RetryResult result;
  for (std::uint32_t n = 1; n <= policy.max_attempts; ++n) {
    if (cancel != nullptr && cancel->cancelled()) {
      result.outcome = RetryOutcome::Cancelled;
      return result;
    }
    result.attempts = n;
    const auto status = attempt(n);
    if (status.ok()) {
      result.outcome = RetryOutcome::Succeeded;
      result.last_error.clear();
      return result;
    }
    result.last_error = status.error();
    if (n == policy.max_attempts) {
      break;
    }
    if (cancel != nullptr) {
      if (cancel->wait_for(policy.interval)) {
        result.outcome = RetryOutcome::Cancelled;
        return result;
      }
    } else if (policy.interval.count() > 0) {
      std::this_thread::sleep_for(policy.interval);
    }
  }
  result.outcome = RetryOutcome::Exhausted;
  return result;
}

} // namespace sandrun::sandbox
