#pragma once

#include "sandrun/common/cancel.hpp"
#include "sandrun/common/result.hpp"
#include "sandrun/queue/job.hpp"
#include "sandrun/sandbox/pool.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace sandrun::run {

enum class ExecutionState {
  Pending,
  Acquiring,
  Executing,
  Succeeded,
  Failed,
  Requeued,
};

[[nodiscard]] std::string_view execution_state_to_string(ExecutionState state);

struct RunOutcome {
  ExecutionState state = ExecutionState::Pending;
  common::ErrorKind error_kind = common::ErrorKind::Generic;
  std::string result;
  std::string sandbox_id;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};

  [[nodiscard]] std::chrono::milliseconds duration() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(finished_at - started_at);
  }
};

struct ExecutorOptions {
  std::chrono::milliseconds acquire_timeout{120'000};
};

/// Drives one job: Pending -> Acquiring -> Executing -> Succeeded | Failed | Requeued.
class RunExecutor {
public:
  RunExecutor(queue::Job job, sandbox::SandboxPool &pool, ExecutorOptions options,
              std::shared_ptr<const common::CancelToken> cancel = nullptr);

  RunExecutor(const RunExecutor &) = delete;
  RunExecutor &operator=(const RunExecutor &) = delete;

  [[nodiscard]] RunOutcome execute();

  [[nodiscard]] ExecutionState state() const { return state_.load(); }
  [[nodiscard]] const queue::Job &job() const { return job_; }

private:
  RunOutcome finish(ExecutionState state, common::ErrorKind kind, std::string result);

  queue::Job job_;
  sandbox::SandboxPool &pool_;
  ExecutorOptions options_;
  std::shared_ptr<const common::CancelToken> cancel_;
  std::atomic<ExecutionState> state_{ExecutionState::Pending};
  RunOutcome outcome_;
};

} // namespace sandrun::run
