#include "sandrun/sandbox/process.hpp"

#include "sandrun/observability/global.hpp"
#include "sandrun/sandbox/retry.hpp"

#include <iostream>
#include <system_error>

namespace sandrun::sandbox {

std::string_view sandbox_state_to_string(const SandboxState state) {
  switch (state) {
  case SandboxState::Starting:
    return "starting";
  case SandboxState::HealthPolling:
    return "health_polling";
  case SandboxState::PreWarming:
    return "pre_warming";
  case SandboxState::Ready:
    return "ready";
  case SandboxState::InUse:
    return "in_use";
  case SandboxState::Draining:
    return "draining";
  case SandboxState::Terminated:
    return "terminated";
  case SandboxState::Failed:
    return "failed";
  }
  return "unknown";
}

SandboxProcess::SandboxProcess(std::string id, config::SandboxConfig config,
                               std::shared_ptr<ISandboxLauncher> launcher,
                               std::shared_ptr<http::HttpClient> http, StateListener listener)
    : id_(std::move(id)), config_(std::move(config)), launcher_(std::move(launcher)),
      http_(std::move(http)), listener_(std::move(listener)) {}

SandboxProcess::~SandboxProcess() { terminate(); }

SandboxState SandboxProcess::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool SandboxProcess::prewarmed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return prewarmed_;
}

std::uint32_t SandboxProcess::consecutive_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return consecutive_failures_;
}

std::optional<std::chrono::system_clock::time_point> SandboxProcess::last_health_check() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_health_check_;
}

common::ErrorKind SandboxProcess::failure_kind() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_kind_;
}

std::string SandboxProcess::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

std::string SandboxProcess::base_url() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handle_.has_value() ? handle_->base_url : std::string();
}

common::Result<SandboxClient> SandboxProcess::client() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!client_.has_value()) {
    return common::Result<SandboxClient>::failure(common::ErrorKind::NotReady,
                                                  "sandbox " + id_ + " has not started");
  }
  return common::Result<SandboxClient>::success(*client_);
}

bool SandboxProcess::transition(const SandboxState to) {
  SandboxState from;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == to || state_ == SandboxState::Terminated) {
      return false;
    }
    if (state_ == SandboxState::Failed && to != SandboxState::Draining) {
      return false;
    }
    if (state_ == SandboxState::Draining && to != SandboxState::Terminated) {
      return false;
    }
    from = state_;
    state_ = to;
  }
  notify(from, to);
  return true;
}

bool SandboxProcess::transition_if(const SandboxState from, const SandboxState to,
                                   const bool notify_listener) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != from) {
      return false;
    }
    state_ = to;
  }
  notify(from, to, notify_listener);
  return true;
}

void SandboxProcess::notify(const SandboxState from, const SandboxState to,
                            const bool notify_listener) {
  // A bound run loses its sandbox on failure or on a forced drain.
  if (to == SandboxState::Failed ||
      (from == SandboxState::InUse && to == SandboxState::Draining)) {
    lost_token_->cancel();
  }
  observability::record_sandbox_state(id_, sandbox_state_to_string(from),
                                      sandbox_state_to_string(to));
  if (notify_listener && listener_) {
    listener_(id_, to);
  }
}

void SandboxProcess::fail(const common::ErrorKind kind, const std::string &message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SandboxState::Failed || state_ == SandboxState::Draining ||
        state_ == SandboxState::Terminated) {
      return;
    }
    failure_kind_ = kind;
    last_error_ = message;
  }
  std::cerr << "[sandbox] " << id_ << " failed (" << common::error_kind_to_string(kind)
            << "): " << message << "\n";
  observability::record_error("sandbox", id_ + ": " + message);
  transition(SandboxState::Failed);
}

common::Status SandboxProcess::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_.has_value()) {
      return common::Status::success();
    }
    if (state_ != SandboxState::Starting) {
      return common::Status::error(common::ErrorKind::NotReady,
                                   "sandbox " + id_ + " cannot start from state " +
                                       std::string(sandbox_state_to_string(state_)));
    }
  }
  if (stop_token_->cancelled()) {
    return common::Status::error(common::ErrorKind::Cancelled, "sandbox " + id_ + " terminated");
  }

  auto launched = launcher_->launch(id_);
  if (!launched.ok()) {
    fail(common::ErrorKind::LaunchError, launched.error());
    return common::Status::error(common::ErrorKind::LaunchError, launched.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  handle_ = launched.value();
  client_.emplace(http_, SandboxEndpoints{.base_url = handle_->base_url,
                                          .health_path = config_.health_path,
                                          .health_timeout_ms = config_.health_timeout_ms,
                                          .operation_timeout_ms = config_.operation_timeout_ms});
  return common::Status::success();
}

common::Status SandboxProcess::check_health() {
  std::optional<SandboxClient> client;
  std::optional<SandboxHandle> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    client = client_;
    handle = handle_;
  }
  if (!client.has_value() || !handle.has_value()) {
    return common::Status::error(common::ErrorKind::NotReady, "sandbox " + id_ + " not started");
  }

  const common::CancelScope scope{stop_token_};
  const auto status = launcher_->is_alive(*handle)
                          ? client->health(&scope)
                          : common::Status::error("sandbox runtime is not running");

  std::lock_guard<std::mutex> lock(mutex_);
  last_health_check_ = std::chrono::system_clock::now();
  if (status.ok()) {
    consecutive_failures_ = 0;
  } else {
    ++consecutive_failures_;
  }
  return status;
}

common::Status SandboxProcess::wait_ready(const std::uint32_t max_attempts,
                                          const std::chrono::milliseconds interval) {
  if (!transition_if(SandboxState::Starting, SandboxState::HealthPolling) &&
      state() != SandboxState::HealthPolling) {
    return common::Status::error(common::ErrorKind::NotReady,
                                 "sandbox " + id_ + " is not awaiting health confirmation");
  }

  const RetryPolicy policy{.max_attempts = max_attempts,
                           .interval = interval,
                           .attempt_timeout =
                               std::chrono::milliseconds(config_.health_timeout_ms)};
  const common::CancelScope scope{stop_token_};
  const auto result = retry(
      policy, [this](std::uint32_t) { return check_health(); }, &scope);

  switch (result.outcome) {
  case RetryOutcome::Succeeded:
    return common::Status::success();
  case RetryOutcome::Cancelled:
    return common::Status::error(common::ErrorKind::Cancelled,
                                 "sandbox " + id_ + " terminated during health polling");
  case RetryOutcome::Exhausted:
    break;
  }
  const std::string message = "no healthy response after " + std::to_string(result.attempts) +
                              " attempts: " + result.last_error;
  fail(common::ErrorKind::HealthCheckTimeout, message);
  return common::Status::error(common::ErrorKind::HealthCheckTimeout, message);
}

void SandboxProcess::pre_warm() {
  if (!transition_if(SandboxState::HealthPolling, SandboxState::PreWarming)) {
    return;
  }

  const auto client = this->client();
  if (client.ok()) {
    const common::CancelScope scope{stop_token_};
    const auto warmed = client.value().navigate_to(config_.prewarm_url, &scope);
    if (warmed.ok()) {
      std::lock_guard<std::mutex> lock(mutex_);
      prewarmed_ = true;
    } else {
      std::cerr << "[sandbox] " << id_ << " pre-warm failed, continuing: " << warmed.error()
                << "\n";
    }
  }

  transition_if(SandboxState::PreWarming, SandboxState::Ready);
}

common::Status SandboxProcess::acquire() {
  if (transition_if(SandboxState::Ready, SandboxState::InUse, false)) {
    return common::Status::success();
  }
  return common::Status::error(common::ErrorKind::NotReady,
                               "sandbox " + id_ + " is " +
                                   std::string(sandbox_state_to_string(state())));
}

common::Status SandboxProcess::release() {
  if (transition_if(SandboxState::InUse, SandboxState::Ready, false)) {
    return common::Status::success();
  }
  return common::Status::error(common::ErrorKind::NotReady,
                               "sandbox " + id_ + " is not in use (" +
                                   std::string(sandbox_state_to_string(state())) + ")");
}

void SandboxProcess::probe_loop() {
  const RetryPolicy policy{.max_attempts = config_.probe_failure_threshold,
                           .interval = std::chrono::milliseconds(config_.probe_interval_ms),
                           .attempt_timeout =
                               std::chrono::milliseconds(config_.health_timeout_ms)};
  const common::CancelScope scope{stop_token_};

  while (!stop_token_->wait_for(policy.interval)) {
    const auto current = state();
    if (current != SandboxState::Ready && current != SandboxState::InUse) {
      return;
    }
    const auto result = retry(
        policy, [this](std::uint32_t) { return check_health(); }, &scope);
    if (result.outcome == RetryOutcome::Cancelled || stop_token_->cancelled()) {
      return;
    }
    if (result.outcome == RetryOutcome::Exhausted) {
      fail(common::ErrorKind::SandboxLost, std::to_string(result.attempts) +
                                               " consecutive liveness probe failures: " +
                                               result.last_error);
      return;
    }
  }
}

void SandboxProcess::supervise() {
  if (!start().ok()) {
    return;
  }
  const auto ready = wait_ready(config_.health_max_attempts,
                                std::chrono::milliseconds(config_.health_interval_ms));
  if (!ready.ok()) {
    return;
  }
  pre_warm();
  probe_loop();
}

void SandboxProcess::spawn_supervisor() {
  std::lock_guard<std::mutex> lock(terminate_mutex_);
  if (supervisor_.joinable() || stop_token_->cancelled()) {
    return;
  }
  supervisor_ = std::thread([this]() { supervise(); });
}

void SandboxProcess::terminate() {
  std::lock_guard<std::mutex> terminate_lock(terminate_mutex_);
  stop_token_->cancel();
  if (supervisor_.joinable()) {
    try {
      supervisor_.join();
    } catch (const std::system_error &err) {
      std::cerr << "[sandbox] " << id_ << " supervisor join failed: " << err.what() << "\n";
    }
  }

  std::optional<SandboxHandle> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SandboxState::Terminated) {
      return;
    }
    handle = handle_;
  }

  transition(SandboxState::Draining);
  if (handle.has_value()) {
    const auto stopped = launcher_->stop(*handle);
    if (!stopped.ok()) {
      std::cerr << "[sandbox] " << id_ << " stop failed: " << stopped.error() << "\n";
      observability::record_error("sandbox", id_ + ": " + stopped.error());
    }
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handle_.reset();
    client_.reset();
  }
  transition(SandboxState::Terminated);
}

} // namespace sandrun::sandbox
