#include "test_framework.hpp"

#include "sandrun/sandbox/docker.hpp"
#include "sandrun/sandbox/launcher.hpp"
#include "sandrun/sandbox/process.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

namespace sb = sandrun::sandbox;
using sandrun::testing::FakeHttpClient;
using sandrun::testing::FakeLauncher;
using sandrun::testing::wait_until;

struct StateLog {
  std::mutex mutex;
  std::vector<sb::SandboxState> states;

  sb::SandboxProcess::StateListener listener() {
    return [this](const std::string &, const sb::SandboxState state) {
      std::lock_guard<std::mutex> lock(mutex);
      states.push_back(state);
    };
  }

  bool saw(const sb::SandboxState state) {
    std::lock_guard<std::mutex> lock(mutex);
    return std::find(states.begin(), states.end(), state) != states.end();
  }
};

class RecordingDockerRunner final : public sb::IDockerRunner {
public:
  std::vector<std::vector<std::string>> calls;
  std::string inspect_output = "true\n";
  bool fail_run = false;

  sandrun::common::Result<sb::DockerProcessResult>
  run(const std::vector<std::string> &args, const sb::DockerCommandOptions &) override {
    calls.push_back(args);
    sb::DockerProcessResult result;
    if (args.front() == "run" && fail_run) {
      return sandrun::common::Result<sb::DockerProcessResult>::failure(
          "Unable to find image 'missing:latest' locally");
    }
    if (args.front() == "inspect") {
      result.stdout_text = inspect_output;
    }
    if (args.front() == "rm") {
      result.exit_code = 1;
      result.stderr_text = "Error: No such container: " + args.back();
    }
    return sandrun::common::Result<sb::DockerProcessResult>::success(result);
  }
};

std::unique_ptr<sb::SandboxProcess> make_process(const std::shared_ptr<FakeLauncher> &launcher,
                                                 const std::shared_ptr<FakeHttpClient> &http,
                                                 sb::SandboxProcess::StateListener listener = nullptr,
                                                 sandrun::config::SandboxConfig config =
                                                     sandrun::testing::fast_sandbox_config()) {
  return std::make_unique<sb::SandboxProcess>("sbx-test", config, launcher, http,
                                              std::move(listener));
}

} // namespace

void register_sandbox_process_tests(std::vector<sandrun::tests::TestCase> &tests) {
  using sandrun::tests::require;
  namespace common = sandrun::common;

  tests.push_back({"sandbox_boots_through_health_and_prewarm_to_ready", [] {
                     auto launcher = std::make_shared<FakeLauncher>();
                     auto http = std::make_shared<FakeHttpClient>();
                     StateLog log;
                     auto process = make_process(launcher, http, log.listener());
                     require(process->state() == sb::SandboxState::Starting, "initial state");

                     process->spawn_supervisor();
                     require(wait_until([&]() {
                               return process->state() == sb::SandboxState::Ready;
                             }),
                             "sandbox should become ready");
                     require(process->prewarmed(), "pre-warm should have succeeded");
                     require(http->action_calls("navigate_to") == 1, "one pre-warm navigation");
                     require(log.saw(sb::SandboxState::HealthPolling), "health polling seen");
                     require(log.saw(sb::SandboxState::PreWarming), "pre-warming seen");
                     require(log.saw(sb::SandboxState::Ready), "ready seen");
                     require(process->last_health_check().has_value(), "health check recorded");
                     require(process->client().ok(), "client available once started");

                     process->terminate();
                     require(process->state() == sb::SandboxState::Terminated, "terminated");
                     require(launcher->stops() == 1, "runtime stopped once");
                     process->terminate();
                     require(launcher->stops() == 1, "terminate is idempotent");
                   }});

  tests.push_back({"sandbox_prewarm_failure_still_reaches_ready", [] {
                     auto launcher = std::make_shared<FakeLauncher>();
                     auto http = std::make_shared<FakeHttpClient>();
                     http->set_action("navigate_to", 500, "browser crashed");
                     auto process = make_process(launcher, http);

                     process->spawn_supervisor();
                     require(wait_until([&]() {
                               return process->state() == sb::SandboxState::Ready;
                             }),
                             "pre-warm failure must not block readiness");
                     require(!process->prewarmed(), "pre-warm should be reported as failed");
                     process->terminate();
                   }});

  tests.push_back({"sandbox_launch_failure_is_launch_error", [] {
                     auto launcher = std::make_shared<FakeLauncher>();
                     launcher->set_launch_failure(true);
                     auto http = std::make_shared<FakeHttpClient>();
                     StateLog log;
                     auto process = make_process(launcher, http, log.listener());

                     const auto started = process->start();
                     require(!started.ok(), "start should fail");
                     require(started.kind() == common::ErrorKind::LaunchError, "kind");
                     require(process->state() == sb::SandboxState::Failed, "failed state");
                     require(process->failure_kind() == common::ErrorKind::LaunchError,
                             "failure kind recorded");
                     require(log.saw(sb::SandboxState::Failed), "listener saw failure");
                     require(process->lost_token()->cancelled(), "lost token fired");
                     require(!process->client().ok(), "no client without a runtime");

                     process->terminate();
                     require(process->state() == sb::SandboxState::Terminated,
                             "failed sandbox still terminates");
                     require(launcher->stops() == 0, "nothing to stop");
                   }});

  tests.push_back({"sandbox_health_timeout_after_max_attempts", [] {
                     auto launcher = std::make_shared<FakeLauncher>();
                     auto http = std::make_shared<FakeHttpClient>();
                     http->set_healthy(false);
                     auto process = make_process(launcher, http);

                     process->spawn_supervisor();
                     require(wait_until([&]() {
                               return process->state() == sb::SandboxState::Failed;
                             }),
                             "sandbox should fail health polling");
                     require(process->failure_kind() == common::ErrorKind::HealthCheckTimeout,
                             "health timeout kind");
                     require(http->health_calls() == 5, "exactly health_max_attempts polls");
                     process->terminate();
                     require(launcher->stops() == 1, "partially started runtime is stopped");
                   }});

  tests.push_back({"sandbox_probe_failures_mark_sandbox_lost", [] {
                     auto launcher = std::make_shared<FakeLauncher>();
                     auto http = std::make_shared<FakeHttpClient>();
                     auto process = make_process(launcher, http);
                     process->spawn_supervisor();
                     require(wait_until([&]() {
                               return process->state() == sb::SandboxState::Ready;
                             }),
                             "ready");
                     require(process->acquire().ok(), "acquire");
                     require(process->state() == sb::SandboxState::InUse, "in use");
                     const auto lost = process->lost_token();
                     require(!lost->cancelled(), "not lost yet");

                     http->set_unhealthy(process->base_url(), true);
                     require(wait_until(
                                 [&]() { return process->state() == sb::SandboxState::Failed; },
                                 std::chrono::seconds(2)),
                             "three failed probes should fail the sandbox");
                     require(process->failure_kind() == common::ErrorKind::SandboxLost,
                             "sandbox lost kind");
                     require(process->consecutive_failures() >= 3, "failures counted");
                     require(lost->cancelled(), "bound run is signalled");
                     require(!process->release().ok(), "failed sandbox cannot be released");
                     process->terminate();
                   }});

  tests.push_back({"sandbox_runtime_exit_detected_by_probe", [] {
                     auto launcher = std::make_shared<FakeLauncher>();
                     auto http = std::make_shared<FakeHttpClient>();
                     auto process = make_process(launcher, http);
                     process->spawn_supervisor();
                     require(wait_until([&]() {
                               return process->state() == sb::SandboxState::Ready;
                             }),
                             "ready");
                     launcher->set_alive(false);
                     require(wait_until([&]() {
                               return process->state() == sb::SandboxState::Failed;
                             }),
                             "dead runtime should be detected");
                     process->terminate();
                   }});

  tests.push_back({"sandbox_acquire_release_follow_state", [] {
                     auto launcher = std::make_shared<FakeLauncher>();
                     auto http = std::make_shared<FakeHttpClient>();
                     auto process = make_process(launcher, http);
                     const auto early = process->acquire();
                     require(!early.ok(), "cannot acquire while starting");
                     require(early.kind() == common::ErrorKind::NotReady, "not ready kind");

                     process->spawn_supervisor();
                     require(wait_until([&]() {
                               return process->state() == sb::SandboxState::Ready;
                             }),
                             "ready");
                     require(process->acquire().ok(), "first acquire");
                     require(!process->acquire().ok(), "second acquire must fail");
                     require(process->release().ok(), "release");
                     require(!process->release().ok(), "double release must fail");
                     require(process->state() == sb::SandboxState::Ready, "back to ready");
                     process->terminate();
                   }});

  tests.push_back({"sandbox_terminate_interrupts_health_polling", [] {
                     auto launcher = std::make_shared<FakeLauncher>();
                     auto http = std::make_shared<FakeHttpClient>();
                     http->set_healthy(false);
                     auto config = sandrun::testing::fast_sandbox_config();
                     config.health_max_attempts = 100000;
                     config.health_interval_ms = 50;
                     auto process = make_process(launcher, http, nullptr, config);

                     process->spawn_supervisor();
                     require(wait_until([&]() { return http->health_calls() > 0; }),
                             "health polling started");
                     const auto started = std::chrono::steady_clock::now();
                     process->terminate();
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(2),
                             "terminate should not wait out the polling budget");
                     require(process->state() == sb::SandboxState::Terminated, "terminated");
                     require(launcher->stops() == 1, "runtime stopped");
                   }});

  tests.push_back({"docker_launcher_runs_and_removes_containers", [] {
                     auto runner = std::make_shared<RecordingDockerRunner>();
                     auto config = sandrun::testing::fast_sandbox_config();
                     config.runtime = "docker";
                     config.image = "automation:test";
                     config.port_range_start = 47100;
                     config.port_range_end = 47120;
                     sb::DockerSandboxLauncher launcher(config, runner);

                     auto handle = launcher.launch("sbx-1");
                     require(handle.ok(), handle.error());
                     require(handle.value().container_name == "sandrun-sbx-sbx-1",
                             "container name");
                     require(handle.value().port >= 47100 && handle.value().port <= 47120,
                             "port from range");
                     require(runner->calls.size() == 2, "rm then run");
                     const auto &run = runner->calls[1];
                     require(run.front() == "run" && run.back() == "automation:test",
                             "run with image last");
                     require(std::find(run.begin(), run.end(), "--shm-size") != run.end(),
                             "shm size passed");
                     const std::string mapping = "127.0.0.1:" +
                                                 std::to_string(handle.value().port) + ":8003";
                     require(std::find(run.begin(), run.end(), mapping) != run.end(),
                             "port mapping");

                     require(launcher.is_alive(handle.value()), "inspect says running");
                     runner->inspect_output = "false";
                     require(!launcher.is_alive(handle.value()), "inspect says stopped");
                     require(launcher.stop(handle.value()).ok(),
                             "missing container is not an error");
                   }});

  tests.push_back({"docker_launcher_reports_launch_error", [] {
                     auto runner = std::make_shared<RecordingDockerRunner>();
                     runner->fail_run = true;
                     auto config = sandrun::testing::fast_sandbox_config();
                     config.runtime = "docker";
                     config.port_range_start = 47130;
                     config.port_range_end = 47131;
                     sb::DockerSandboxLauncher launcher(config, runner);
                     auto handle = launcher.launch("sbx-2");
                     require(!handle.ok(), "launch should fail");
                     require(handle.kind() == common::ErrorKind::LaunchError, "launch error kind");
                   }});

  tests.push_back({"process_launcher_starts_and_stops_child", [] {
                     auto config = sandrun::testing::fast_sandbox_config();
                     config.command = {"sleep", "30"};
                     config.port_range_start = 47200;
                     config.port_range_end = 47210;
                     sb::ProcessSandboxLauncher launcher(config, std::chrono::seconds(2));

                     auto handle = launcher.launch("sbx-3");
                     require(handle.ok(), handle.error());
                     require(handle.value().pid > 0, "child pid");
                     require(launcher.is_alive(handle.value()), "child running");
                     require(launcher.stop(handle.value()).ok(), "stop");
                     require(!launcher.is_alive(handle.value()), "child gone");
                   }});

  tests.push_back({"process_launcher_reports_exec_failure", [] {
                     auto config = sandrun::testing::fast_sandbox_config();
                     config.command = {"/nonexistent/sandrun-automation-service"};
                     config.port_range_start = 47220;
                     config.port_range_end = 47230;
                     sb::ProcessSandboxLauncher launcher(config);
                     auto handle = launcher.launch("sbx-4");
                     require(!handle.ok(), "exec should fail");
                     require(handle.kind() == common::ErrorKind::LaunchError, "launch error kind");
                   }});
}
