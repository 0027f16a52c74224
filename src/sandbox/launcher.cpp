#include "sandrun/sandbox/launcher.hpp"

#include "sandrun/common/fs.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace sandrun::sandbox {

namespace {

bool is_port_available(const std::string &host, const std::uint16_t port) {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return false;
  }
  int reuse = 1;
  (void)setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  }
  const int rc = bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  close(fd);
  return rc == 0;
}

} // namespace

std::string sandbox_base_url(const std::string &host, const std::uint16_t port) {
  return "http://" + host + ":" + std::to_string(port);
}

PortAllocator::PortAllocator(std::string host, const std::uint16_t first, const std::uint16_t last)
    : host_(std::move(host)), first_(first), last_(last) {}

common::Result<std::uint16_t> PortAllocator::reserve() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::uint32_t port = first_; port <= last_; ++port) {
    const auto candidate = static_cast<std::uint16_t>(port);
    if (reserved_.contains(candidate) || !is_port_available(host_, candidate)) {
      continue;
    }
    reserved_.insert(candidate);
    return common::Result<std::uint16_t>::success(candidate);
  }
  return common::Result<std::uint16_t>::failure(
      common::ErrorKind::LaunchError, "no free sandbox port in range " + std::to_string(first_) +
                                          "-" + std::to_string(last_));
}

void PortAllocator::release(const std::uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  reserved_.erase(port);
}

// --- docker ---------------------------------------------------------------

DockerSandboxLauncher::DockerSandboxLauncher(config::SandboxConfig config,
                                             std::shared_ptr<IDockerRunner> runner)
    : config_(std::move(config)), runner_(std::move(runner)),
      ports_(config_.host, config_.port_range_start, config_.port_range_end) {}

common::Result<SandboxHandle> DockerSandboxLauncher::launch(const std::string &sandbox_id) {
  auto port = ports_.reserve();
  if (!port.ok()) {
    return common::Result<SandboxHandle>::failure(port.kind(), port.error());
  }

  SandboxHandle handle;
  handle.sandbox_id = sandbox_id;
  handle.port = port.value();
  handle.container_name = config_.container_prefix + sandbox_id;
  handle.base_url = sandbox_base_url(config_.host, handle.port);

  // A container left behind by a crashed worker would hold the name.
  const auto cleanup =
      runner_->run({"rm", "-f", handle.container_name}, DockerCommandOptions{.allow_failure = true});
  if (!cleanup.ok()) {
    ports_.release(handle.port);
    return common::Result<SandboxHandle>::failure(common::ErrorKind::LaunchError, cleanup.error());
  }

  std::vector<std::string> args = {"run",
                                   "-d",
                                   "--name",
                                   handle.container_name,
                                   "-p",
                                   config_.host + ":" + std::to_string(handle.port) + ":" +
                                       std::to_string(config_.container_port)};
  if (!common::trim(config_.shm_size).empty()) {
    args.push_back("--shm-size");
    args.push_back(config_.shm_size);
  }
  args.push_back(config_.image);

  const auto started = runner_->run(args, DockerCommandOptions{.timeout = std::chrono::minutes(2)});
  if (!started.ok()) {
    ports_.release(handle.port);
    return common::Result<SandboxHandle>::failure(
        common::ErrorKind::LaunchError,
        "docker run failed for " + handle.container_name + ": " + common::trim(started.error()));
  }
  return common::Result<SandboxHandle>::success(std::move(handle));
}

common::Status DockerSandboxLauncher::stop(const SandboxHandle &handle) {
  const auto removed =
      runner_->run({"rm", "-f", handle.container_name}, DockerCommandOptions{.allow_failure = true});
  ports_.release(handle.port);
  if (!removed.ok()) {
    return common::Status::error(removed.error());
  }
  if (removed.value().exit_code != 0 &&
      removed.value().stderr_text.find("No such container") == std::string::npos) {
    return common::Status::error("docker rm failed for " + handle.container_name + ": " +
                                 common::trim(removed.value().stderr_text));
  }
  return common::Status::success();
}

bool DockerSandboxLauncher::is_alive(const SandboxHandle &handle) {
  const auto inspected =
      runner_->run({"inspect", "-f", "{{.State.Running}}", handle.container_name},
                   DockerCommandOptions{.allow_failure = true, .timeout = std::chrono::seconds(10)});
  return inspected.ok() && inspected.value().exit_code == 0 &&
         common::trim(inspected.value().stdout_text) == "true";
}

// --- local process ---------------------------------------------------------

ProcessSandboxLauncher::ProcessSandboxLauncher(config::SandboxConfig config,
                                               const std::chrono::milliseconds stop_grace)
    : config_(std::move(config)), stop_grace_(stop_grace),
      ports_(config_.host, config_.port_range_start, config_.port_range_end) {}

common::Result<SandboxHandle> ProcessSandboxLauncher::launch(const std::string &sandbox_id) {
  using Out = common::Result<SandboxHandle>;
  if (config_.command.empty()) {
    return Out::failure(common::ErrorKind::LaunchError, "sandbox.command is empty");
  }
  auto port = ports_.reserve();
  if (!port.ok()) {
    return Out::failure(port.kind(), port.error());
  }

  const std::string port_text = std::to_string(port.value());
  std::vector<std::string> args;
  args.reserve(config_.command.size());
  for (const auto &arg : config_.command) {
    args.push_back(common::replace_all(arg, "{port}", port_text));
  }
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  // The child reports an exec failure through this pipe; a clean exec closes it.
  int exec_pipe[2] = {-1, -1};
  if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
    ports_.release(port.value());
    return Out::failure(common::ErrorKind::LaunchError, "failed to create exec pipe");
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(exec_pipe[0]);
    close(exec_pipe[1]);
    ports_.release(port.value());
    return Out::failure(common::ErrorKind::LaunchError, "failed to fork sandbox process");
  }

  if (pid == 0) {
    close(exec_pipe[0]);
    (void)setpgid(0, 0);
    (void)setenv("PORT", port_text.c_str(), 1);
    (void)setenv("SANDRUN_SANDBOX_ID", sandbox_id.c_str(), 1);
    execvp(argv[0], argv.data());
    const int err = errno;
    (void)write(exec_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  close(exec_pipe[1]);
  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  close(exec_pipe[0]);

  if (got > 0) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    ports_.release(port.value());
    return Out::failure(common::ErrorKind::LaunchError,
                        "failed to exec " + args.front() + ": " + std::strerror(child_errno));
  }

  SandboxHandle handle;
  handle.sandbox_id = sandbox_id;
  handle.port = port.value();
  handle.pid = pid;
  handle.base_url = sandbox_base_url(config_.host, handle.port);
  return Out::success(std::move(handle));
}

common::Status ProcessSandboxLauncher::stop(const SandboxHandle &handle) {
  if (handle.pid <= 0) {
    return common::Status::success();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_.contains(handle.pid)) {
      exited_.erase(handle.pid);
      ports_.release(handle.port);
      return common::Status::success();
    }
  }

  (void)kill(-handle.pid, SIGTERM);
  int status = 0;
  const auto deadline = std::chrono::steady_clock::now() + stop_grace_;
  while (std::chrono::steady_clock::now() < deadline) {
    const pid_t waited = waitpid(handle.pid, &status, WNOHANG);
    if (waited == handle.pid || (waited < 0 && errno == ECHILD)) {
      ports_.release(handle.port);
      return common::Status::success();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  (void)kill(-handle.pid, SIGKILL);
  const pid_t waited = waitpid(handle.pid, &status, 0);
  ports_.release(handle.port);
  if (waited < 0 && errno != ECHILD) {
    return common::Status::error("failed to reap sandbox process " + std::to_string(handle.pid));
  }
  return common::Status::success();
}

bool ProcessSandboxLauncher::is_alive(const SandboxHandle &handle) {
  if (handle.pid <= 0) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (exited_.contains(handle.pid)) {
    return false;
  }
  int status = 0;
  const pid_t waited = waitpid(handle.pid, &status, WNOHANG);
  if (waited == 0) {
    return true;
  }
  exited_.insert(handle.pid);
  return false;
}

common::Result<std::shared_ptr<ISandboxLauncher>>
create_launcher(const config::SandboxConfig &config) {
  using Out = common::Result<std::shared_ptr<ISandboxLauncher>>;
  const std::string runtime = common::to_lower(common::trim(config.runtime));
  if (runtime == "docker") {
    return Out::success(
        std::make_shared<DockerSandboxLauncher>(config, std::make_shared<DockerCliRunner>()));
  }
  if (runtime == "process") {
    return Out::success(std::make_shared<ProcessSandboxLauncher>(config));
  }
  return Out::failure(common::ErrorKind::LaunchError, "unknown sandbox runtime: " + config.runtime);
}

} // namespace sandrun::sandbox
