#include "sandrun/daemon/pid_file.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace sandrun::daemon {

namespace {

int read_pid(const std::filesystem::path &path) {
  std::ifstream in(path);
  int pid = 0;
  in >> pid;
  return in ? pid : 0;
}

} // namespace

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

PidFile::~PidFile() { release(); }

common::Status PidFile::acquire() {
  if (acquired_) {
    return common::Status::success();
  }

  std::error_code ec;
  if (!path_.parent_path().empty()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return common::Status::error("failed to create pid directory: " + ec.message());
    }
  }

  // O_EXCL makes creation the lock: two workers racing for one directory cannot both win.
  // A second pass follows the removal of a stale file.
  for (int pass = 0; pass < 2; ++pass) {
    const int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd >= 0) {
      const std::string content = std::to_string(getpid()) + "\n";
      const bool written =
          ::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size());
      ::close(fd);
      if (!written) {
        std::filesystem::remove(path_, ec);
        return common::Status::error("failed to write pid file: " + path_.string());
      }
      acquired_ = true;
      return common::Status::success();
    }
    if (errno != EEXIST) {
      return common::Status::error("failed to create pid file " + path_.string() + ": " +
                                   std::strerror(errno));
    }

    const int existing_pid = read_pid(path_);
    if (existing_pid > 0 && is_process_running(existing_pid)) {
      return common::Status::error("worker already running with pid " +
                                   std::to_string(existing_pid));
    }
    std::filesystem::remove(path_, ec);
    if (ec) {
      return common::Status::error("failed to remove stale pid file: " + ec.message());
    }
  }
  return common::Status::error("pid file " + path_.string() + " keeps reappearing");
}

void PidFile::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  acquired_ = false;
}

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  // EPERM means the process exists but belongs to someone else.
  return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace sandrun::daemon
