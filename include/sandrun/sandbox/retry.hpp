#pragma once

#include "sandrun/common/cancel.hpp"
#include "sandrun/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace sandrun::sandbox {

struct RetryPolicy {
  std::uint32_t max_attempts = 1;
  std::chrono::milliseconds interval{0};
  std::chrono::milliseconds attempt_timeout{0};
};

enum class RetryOutcome {
  Succeeded,
  Exhausted,
  Cancelled,
};

struct RetryResult {
  RetryOutcome outcome = RetryOutcome::Exhausted;
  std::uint32_t attempts = 0;
  std::string last_error;
};

using RetryAttempt = std::function<common::Status(std::uint32_t attempt)>;

/// Runs `attempt` until it succeeds, `policy.max_attempts` attempts have failed, or `cancel`
/// fires. Sleeps `policy.interval` between attempts, never after the last one.
[[nodiscard]] RetryResult retry(const RetryPolicy &policy, const RetryAttempt &attempt,
                                const common::CancelScope *cancel = nullptr);

} // namespace sandrun::sandbox
