#pragma once

#include "sandrun/common/cancel.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace sandrun::daemon {

class StateWriter {
public:
  using ExtraStateFn = std::function<std::string()>;

  StateWriter(std::filesystem::path state_file, ExtraStateFn extra = nullptr,
              std::chrono::milliseconds interval = std::chrono::seconds(5));
  ~StateWriter();

  StateWriter(const StateWriter &) = delete;
  StateWriter &operator=(const StateWriter &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  bool write_state() const;

private:
  void write_loop();

  std::filesystem::path state_file_;
  ExtraStateFn extra_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<common::CancelToken> stop_token_;
  std::thread thread_;
  std::chrono::steady_clock::time_point started_at_{};
};

} // namespace sandrun::daemon
