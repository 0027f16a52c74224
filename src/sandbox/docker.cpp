#include "sandrun/sandbox/docker.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandrun::sandbox {

namespace {

/// Both ends of a pipe, closed on scope exit.
struct Pipe {
  int fds[2] = {-1, -1};

  Pipe() = default;
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;
  ~Pipe() {
    close_read();
    close_write();
  }

  bool open() { return pipe(fds) == 0; }
  [[nodiscard]] int read_end() const { return fds[0]; }
  [[nodiscard]] int write_end() const { return fds[1]; }
  void close_read() {
    if (fds[0] >= 0) {
      close(fds[0]);
      fds[0] = -1;
    }
  }
  void close_write() {
    if (fds[1] >= 0) {
      close(fds[1]);
      fds[1] = -1;
    }
  }
};

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void drain(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes <= 0) {
      return;
    }
    buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
  }
}

std::string join_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

} // namespace

DockerCliRunner::DockerCliRunner(std::string binary) : binary_(std::move(binary)) {}

common::Result<DockerProcessResult>
DockerCliRunner::run(const std::vector<std::string> &args, const DockerCommandOptions &options) {
  using Out = common::Result<DockerProcessResult>;
  if (args.empty()) {
    return Out::failure(common::ErrorKind::LaunchError, "docker command is empty");
  }

  Pipe out_pipe;
  Pipe err_pipe;
  if (!out_pipe.open() || !err_pipe.open()) {
    return Out::failure(common::ErrorKind::LaunchError, "failed to create pipes for docker");
  }

  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(binary_.c_str()));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    return Out::failure(common::ErrorKind::LaunchError, "failed to fork docker process");
  }

  if (pid == 0) {
    (void)dup2(out_pipe.write_end(), STDOUT_FILENO);
    (void)dup2(err_pipe.write_end(), STDERR_FILENO);
    close(out_pipe.read_end());
    close(err_pipe.read_end());
    execvp(binary_.c_str(), argv.data());
    _exit(127);
  }

  out_pipe.close_write();
  err_pipe.close_write();
  set_non_blocking(out_pipe.read_end());
  set_non_blocking(err_pipe.read_end());

  DockerProcessResult result;
  int status = 0;
  bool timed_out = false;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    drain(out_pipe.read_end(), result.stdout_text);
    drain(err_pipe.read_end(), result.stderr_text);

    if (waitpid(pid, &status, WNOHANG) == pid) {
      break;
    }
    if (std::chrono::steady_clock::now() - started > options.timeout) {
      timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = out_pipe.read_end(), .events = POLLIN, .revents = 0},
        {.fd = err_pipe.read_end(), .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  drain(out_pipe.read_end(), result.stdout_text);
  drain(err_pipe.read_end(), result.stderr_text);
  result.exit_code = (!timed_out && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;

  if (options.allow_failure) {
    return Out::success(std::move(result));
  }
  if (timed_out) {
    return Out::failure(common::ErrorKind::LaunchError,
                        "docker command timed out: " + join_args(args));
  }
  if (result.exit_code == 127) {
    return Out::failure(common::ErrorKind::LaunchError, binary_ + " executable not found");
  }
  if (result.exit_code != 0) {
    return Out::failure(common::ErrorKind::LaunchError,
                        result.stderr_text.empty() ? "docker command failed: " + join_args(args)
                                                   : result.stderr_text);
  }
  return Out::success(std::move(result));
}

} // namespace sandrun::sandbox
