#include "sandrun/run/executor.hpp"

#include "sandrun/common/fs.hpp"
#include "sandrun/common/json_util.hpp"
#include "sandrun/observability/global.hpp"
#include "sandrun/run/payload.hpp"

#include <optional>
#include <sstream>
#include <vector>

namespace sandrun::run {

namespace {

std::string build_result(const std::vector<std::string> &bodies) {
  std::ostringstream json;
  json << "{\"steps\":[";
  for (std::size_t i = 0; i < bodies.size(); ++i) {
    if (i > 0) {
      json << ",";
    }
    if (common::json_is_object(bodies[i])) {
      json << bodies[i];
    } else if (bodies[i].empty()) {
      json << "null";
    } else {
      json << "\"" << common::json_escape(bodies[i]) << "\"";
    }
  }
  json << "]}";
  return json.str();
}

} // namespace

std::string_view execution_state_to_string(const ExecutionState state) {
  switch (state) {
  case ExecutionState::Pending:
    return "pending";
  case ExecutionState::Acquiring:
    return "acquiring";
  case ExecutionState::Executing:
    return "executing";
  case ExecutionState::Succeeded:
    return "succeeded";
  case ExecutionState::Failed:
    return "failed";
  case ExecutionState::Requeued:
    return "requeued";
  }
  return "unknown";
}

RunExecutor::RunExecutor(queue::Job job, sandbox::SandboxPool &pool, ExecutorOptions options,
                         std::shared_ptr<const common::CancelToken> cancel)
    : job_(std::move(job)), pool_(pool), options_(options), cancel_(std::move(cancel)) {}

RunOutcome RunExecutor::finish(const ExecutionState state, const common::ErrorKind kind,
                               std::string result) {
  outcome_.state = state;
  outcome_.error_kind = kind;
  outcome_.result = std::move(result);
  outcome_.finished_at = std::chrono::system_clock::now();
  state_.store(state);

  std::string label(execution_state_to_string(state));
  if (state != ExecutionState::Succeeded) {
    label += ":" + std::string(common::error_kind_to_string(kind));
  }
  observability::record_run_end(job_.run_id, label, outcome_.duration());
  return outcome_;
}

RunOutcome RunExecutor::execute() {
  outcome_.started_at = std::chrono::system_clock::now();

  const auto steps = parse_payload(job_.payload);
  if (!steps.ok()) {
    return finish(ExecutionState::Failed, common::ErrorKind::InvalidPayload, steps.error());
  }

  state_.store(ExecutionState::Acquiring);
  const common::CancelScope acquire_scope{cancel_};
  auto acquired = pool_.acquire_sandbox(options_.acquire_timeout, &acquire_scope);
  if (!acquired.ok()) {
    const auto kind = acquired.kind() == common::ErrorKind::Cancelled
                          ? common::ErrorKind::Cancelled
                          : common::ErrorKind::PoolExhausted;
    return finish(ExecutionState::Requeued, kind, acquired.error());
  }

  sandbox::SandboxLease lease = std::move(acquired.value());
  const auto lost = lease.lost_token();
  outcome_.sandbox_id = lease.sandbox_id();
  state_.store(ExecutionState::Executing);
  observability::record_run_start(job_.run_id, job_.attempt, outcome_.sandbox_id);

  const auto client = lease.sandbox().client();
  if (!client.ok()) {
    lease.release(false);
    return finish(ExecutionState::Requeued, common::ErrorKind::SandboxLost, client.error());
  }

  const common::CancelScope scope{cancel_, lost};
  const auto interrupted = [&]() -> std::optional<RunOutcome> {
    if (lost != nullptr && lost->cancelled()) {
      lease.release(false);
      return finish(ExecutionState::Requeued, common::ErrorKind::SandboxLost,
                    "sandbox " + outcome_.sandbox_id + " was lost");
    }
    if (cancel_ != nullptr && cancel_->cancelled()) {
      lease.release(false);
      return finish(ExecutionState::Requeued, common::ErrorKind::Cancelled,
                    "run cancelled by shutdown");
    }
    return std::nullopt;
  };

  std::vector<std::string> bodies;
  bodies.reserve(steps.value().size());
  for (std::size_t i = 0; i < steps.value().size(); ++i) {
    if (auto stopped = interrupted(); stopped.has_value()) {
      return *stopped;
    }
    const auto &step = steps.value()[i];
    auto response = client.value().perform(step.action, step.params_json, &scope);
    if (!response.ok()) {
      if (auto stopped = interrupted(); stopped.has_value()) {
        return *stopped;
      }
      lease.release(false);
      return finish(ExecutionState::Failed, common::ErrorKind::ExecutionFault,
                    "step " + std::to_string(i + 1) + " (" + step.action +
                        "): " + response.error());
    }
    bodies.push_back(common::trim(response.value()));
  }

  lease.release(true);
  return finish(ExecutionState::Succeeded, common::ErrorKind::Generic, build_result(bodies));
}

} // namespace sandrun::run
