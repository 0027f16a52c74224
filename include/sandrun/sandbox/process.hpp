#pragma once

#include "sandrun/common/cancel.hpp"
#include "sandrun/common/result.hpp"
#include "sandrun/config/schema.hpp"
#include "sandrun/http/client.hpp"
#include "sandrun/sandbox/client.hpp"
#include "sandrun/sandbox/launcher.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace sandrun::sandbox {

enum class SandboxState {
  Starting,
  HealthPolling,
  PreWarming,
  Ready,
  InUse,
  Draining,
  Terminated,
  Failed,
};

[[nodiscard]] std::string_view sandbox_state_to_string(SandboxState state);

/// Supervises one automation-service instance from launch to termination.
///
/// The lifecycle is Starting -> HealthPolling -> PreWarming -> Ready <-> InUse, then
/// Draining -> Terminated. Failed is reachable from any non-terminal state. Once Ready, a
/// background liveness probe moves the instance to Failed after
/// `probe_failure_threshold` consecutive failures and cancels lost_token().
class SandboxProcess {
public:
  using StateListener = std::function<void(const std::string &sandbox_id, SandboxState state)>;

  SandboxProcess(std::string id, config::SandboxConfig config,
                 std::shared_ptr<ISandboxLauncher> launcher,
                 std::shared_ptr<http::HttpClient> http, StateListener listener = nullptr);
  ~SandboxProcess();

  SandboxProcess(const SandboxProcess &) = delete;
  SandboxProcess &operator=(const SandboxProcess &) = delete;

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] SandboxState state() const;
  [[nodiscard]] bool prewarmed() const;
  [[nodiscard]] std::uint32_t consecutive_failures() const;
  [[nodiscard]] std::optional<std::chrono::system_clock::time_point> last_health_check() const;
  [[nodiscard]] common::ErrorKind failure_kind() const;
  [[nodiscard]] std::string last_error() const;
  [[nodiscard]] std::string base_url() const;

  [[nodiscard]] std::shared_ptr<const common::CancelToken> lost_token() const {
    return lost_token_;
  }

  [[nodiscard]] common::Status start();
  [[nodiscard]] common::Status wait_ready(std::uint32_t max_attempts,
                                          std::chrono::milliseconds interval);
  void pre_warm();

  [[nodiscard]] common::Status acquire();
  [[nodiscard]] common::Status release();

  void terminate();

  void spawn_supervisor();

  [[nodiscard]] common::Result<SandboxClient> client() const;

private:
  void supervise();
  void probe_loop();
  [[nodiscard]] common::Status check_health();
  bool transition(SandboxState to);
  bool transition_if(SandboxState from, SandboxState to, bool notify_listener = true);
  void fail(common::ErrorKind kind, const std::string &message);
  void notify(SandboxState from, SandboxState to, bool notify_listener = true);

  std::string id_;
  config::SandboxConfig config_;
  std::shared_ptr<ISandboxLauncher> launcher_;
  std::shared_ptr<http::HttpClient> http_;
  StateListener listener_;

  std::shared_ptr<common::CancelToken> stop_token_ = std::make_shared<common::CancelToken>();
  std::shared_ptr<common::CancelToken> lost_token_ = std::make_shared<common::CancelToken>();

  mutable std::mutex mutex_;
  SandboxState state_ = SandboxState::Starting;
  std::optional<SandboxHandle> handle_;
  std::optional<SandboxClient> client_;
  bool prewarmed_ = false;
  std::uint32_t consecutive_failures_ = 0;
  std::optional<std::chrono::system_clock::time_point> last_health_check_;
  common::ErrorKind failure_kind_ = common::ErrorKind::Generic;
  std::string last_error_;

  std::mutex terminate_mutex_;
  std::thread supervisor_;
};

} // namespace sandrun::sandbox
