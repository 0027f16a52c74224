#pragma once

#include "sandrun/common/result.hpp"

#include <filesystem>

namespace sandrun::daemon {

class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

  [[nodiscard]] common::Status acquire();
  void release();
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace sandrun::daemon
