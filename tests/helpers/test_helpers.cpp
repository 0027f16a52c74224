#include "tests/helpers/test_helpers.hpp"

#include "sandrun/common/fs.hpp"
#include "sandrun/sandbox/process.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <thread>

namespace sandrun::testing {

namespace {

constexpr const char *kAutomationPrefix = "/api/automation/";

} // namespace

void FakeHttpClient::set_healthy(const bool healthy) {
  std::lock_guard<std::mutex> lock(mutex_);
  healthy_ = healthy;
}

void FakeHttpClient::set_unhealthy(const std::string &base_url, const bool unhealthy) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unhealthy) {
    unhealthy_.insert(base_url);
  } else {
    unhealthy_.erase(base_url);
  }
}

void FakeHttpClient::set_action(const std::string &action, const std::uint16_t status,
                                std::string body) {
  std::lock_guard<std::mutex> lock(mutex_);
  http::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  actions_[action] = std::move(response);
  blocking_.erase(action);
}

void FakeHttpClient::set_blocking(const std::string &action) {
  std::lock_guard<std::mutex> lock(mutex_);
  blocking_.insert(action);
}

std::size_t FakeHttpClient::action_calls(const std::string &action) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = calls_.find(action);
  return it == calls_.end() ? 0 : it->second;
}

std::size_t FakeHttpClient::health_calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return health_calls_;
}

std::size_t FakeHttpClient::blocked_calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocked_;
}

http::HttpResponse FakeHttpClient::get(const std::string &url, std::uint64_t,
                                       const common::CancelScope *cancel) {
  http::HttpResponse response;
  if (cancel != nullptr && cancel->cancelled()) {
    response.cancelled = true;
    return response;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  ++health_calls_;
  bool healthy = healthy_;
  for (const auto &base : unhealthy_) {
    if (common::starts_with(url, base)) {
      healthy = false;
    }
  }
  response.status = healthy ? 200 : 503;
  response.body = healthy ? "{\"status\":\"ok\"}" : "unavailable";
  return response;
}

http::HttpResponse FakeHttpClient::post_json(const std::string &url, const std::string &,
                                             const std::uint64_t timeout_ms,
                                             const common::CancelScope *cancel) {
  const auto pos = url.find(kAutomationPrefix);
  const std::string action =
      pos == std::string::npos ? url : url.substr(pos + std::string(kAutomationPrefix).size());

  bool blocking = false;
  http::HttpResponse response;
  response.status = 200;
  response.body = "{\"ok\":true}";
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_[action];
    blocking = blocking_.contains(action);
    if (blocking) {
      ++blocked_;
    }
    if (const auto it = actions_.find(action); it != actions_.end()) {
      response = it->second;
    }
  }

  if (blocking) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
      if (cancel != nullptr && cancel->wait_for(std::chrono::milliseconds(5))) {
        http::HttpResponse aborted;
        aborted.cancelled = true;
        return aborted;
      }
      if (cancel == nullptr) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
    }
    http::HttpResponse timed_out;
    timed_out.timeout = true;
    return timed_out;
  }
  return response;
}

void FakeLauncher::set_launch_failure(const bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_launch_ = fail;
}

void FakeLauncher::set_alive(const bool alive) {
  std::lock_guard<std::mutex> lock(mutex_);
  alive_ = alive;
}

std::size_t FakeLauncher::launches() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return launches_;
}

std::size_t FakeLauncher::stops() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stops_;
}

common::Result<sandbox::SandboxHandle> FakeLauncher::launch(const std::string &sandbox_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fail_launch_) {
    return common::Result<sandbox::SandboxHandle>::failure(common::ErrorKind::LaunchError,
                                                           "image not found");
  }
  ++launches_;
  sandbox::SandboxHandle handle;
  handle.sandbox_id = sandbox_id;
  handle.port = static_cast<std::uint16_t>(20000 + launches_);
  handle.base_url = "http://" + sandbox_id + ".sandbox";
  handle.container_name = "fake-" + sandbox_id;
  return common::Result<sandbox::SandboxHandle>::success(handle);
}

common::Status FakeLauncher::stop(const sandbox::SandboxHandle &) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stops_;
  return common::Status::success();
}

bool FakeLauncher::is_alive(const sandbox::SandboxHandle &) {
  std::lock_guard<std::mutex> lock(mutex_);
  return alive_;
}

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("sandrun-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempDir::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

config::SandboxConfig fast_sandbox_config() {
  config::SandboxConfig config;
  config.runtime = "process";
  config.command = {"true"};
  config.health_max_attempts = 5;
  config.health_interval_ms = 5;
  config.health_timeout_ms = 50;
  config.probe_interval_ms = 20;
  config.probe_failure_threshold = 3;
  config.operation_timeout_ms = 2000;
  return config;
}

config::Config temp_config(const TempDir &dir) {
  config::Config config;
  config.sandbox = fast_sandbox_config();
  config.pool.max_size = 2;
  config.pool.min_ready = 0;
  config.pool.acquire_timeout_ms = 500;
  config.queue.db_path = (dir.path() / "queue.db").string();
  config.queue.poll_interval_ms = 10;
  config.queue.visibility_timeout_secs = 30;
  config.queue.max_attempts = 3;
  config.queue.requeue_delay_ms = 0;
  config.observability.backend = "none";
  config.worker.state_file = (dir.path() / "worker_state.json").string();
  return config;
}

sandbox::SandboxPool::SandboxFactory make_factory(config::SandboxConfig config,
                                                  std::shared_ptr<FakeLauncher> launcher,
                                                  std::shared_ptr<FakeHttpClient> http) {
  return [config = std::move(config), launcher = std::move(launcher), http = std::move(http)](
             const std::string &sandbox_id, sandbox::SandboxProcess::StateListener listener) {
    return std::make_unique<sandbox::SandboxProcess>(sandbox_id, config, launcher, http,
                                                     std::move(listener));
  };
}

bool wait_until(const std::function<bool()> &predicate, const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

} // namespace sandrun::testing
