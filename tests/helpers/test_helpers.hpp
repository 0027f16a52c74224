#pragma once

#include "sandrun/config/schema.hpp"
#include "sandrun/http/client.hpp"
#include "sandrun/sandbox/launcher.hpp"
#include "sandrun/sandbox/pool.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace sandrun::testing {

/// Scripted stand-in for the automation service of every sandbox.
class FakeHttpClient final : public http::HttpClient {
public:
  void set_healthy(bool healthy);
  /// Health of the sandbox behind `base_url` only.
  void set_unhealthy(const std::string &base_url, bool unhealthy);
  void set_action(const std::string &action, std::uint16_t status, std::string body);
  /// The action hangs until the caller's cancellation fires or its timeout elapses.
  void set_blocking(const std::string &action);

  [[nodiscard]] std::size_t action_calls(const std::string &action) const;
  [[nodiscard]] std::size_t health_calls() const;
  [[nodiscard]] std::size_t blocked_calls() const;

  [[nodiscard]] http::HttpResponse get(const std::string &url, std::uint64_t timeout_ms,
                                       const common::CancelScope *cancel = nullptr) override;
  [[nodiscard]] http::HttpResponse post_json(const std::string &url, const std::string &body,
                                             std::uint64_t timeout_ms,
                                             const common::CancelScope *cancel = nullptr) override;

private:
  mutable std::mutex mutex_;
  bool healthy_ = true;
  std::set<std::string> unhealthy_;
  std::map<std::string, http::HttpResponse> actions_;
  std::set<std::string> blocking_;
  std::map<std::string, std::size_t> calls_;
  std::size_t health_calls_ = 0;
  std::size_t blocked_ = 0;
};

class FakeLauncher final : public sandbox::ISandboxLauncher {
public:
  void set_launch_failure(bool fail);
  void set_alive(bool alive);

  [[nodiscard]] std::size_t launches() const;
  [[nodiscard]] std::size_t stops() const;

  [[nodiscard]] common::Result<sandbox::SandboxHandle>
  launch(const std::string &sandbox_id) override;
  [[nodiscard]] common::Status stop(const sandbox::SandboxHandle &handle) override;
  [[nodiscard]] bool is_alive(const sandbox::SandboxHandle &handle) override;

private:
  mutable std::mutex mutex_;
  bool fail_launch_ = false;
  bool alive_ = true;
  std::size_t launches_ = 0;
  std::size_t stops_ = 0;
};

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

/// Millisecond-scale timings so lifecycle tests finish quickly.
config::SandboxConfig fast_sandbox_config();

/// Config rooted in `dir`, with the fast sandbox timings and no observer output.
config::Config temp_config(const TempDir &dir);

sandbox::SandboxPool::SandboxFactory make_factory(config::SandboxConfig config,
                                                  std::shared_ptr<FakeLauncher> launcher,
                                                  std::shared_ptr<FakeHttpClient> http);

/// Polls `predicate` until it holds or `timeout` passes.
bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout = std::chrono::seconds(5));

} // namespace sandrun::testing
