#include "sandrun/daemon/state_writer.hpp"

#include "sandrun/common/fs.hpp"
#include "sandrun/health/health.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace sandrun::daemon {

StateWriter::StateWriter(std::filesystem::path state_file, ExtraStateFn extra,
                         const std::chrono::milliseconds interval)
    : state_file_(std::move(state_file)), extra_(std::move(extra)), interval_(interval) {}

StateWriter::~StateWriter() { stop(); }

void StateWriter::start() {
  if (is_running()) {
    return;
  }
  stop_token_ = std::make_shared<common::CancelToken>();
  started_at_ = std::chrono::steady_clock::now();
  thread_ = std::thread([this]() { write_loop(); });
}

void StateWriter::stop() {
  if (stop_token_ != nullptr) {
    stop_token_->cancel();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool StateWriter::is_running() const {
  return thread_.joinable() && stop_token_ != nullptr && !stop_token_->cancelled();
}

void StateWriter::write_loop() {
  do {
    if (!write_state()) {
      std::cerr << "[state] failed to write " << state_file_ << "\n";
    }
  } while (!stop_token_->wait_for(interval_));
  // Final write so the file reflects the stopped state.
  (void)write_state();
}

bool StateWriter::write_state() const {
  const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::steady_clock::now() - started_at_)
                          .count();

  std::ostringstream json;
  json << "{";
  json << "\"written_at\":\"" << common::now_rfc3339() << "\",";
  json << "\"uptime_seconds\":" << uptime << ",";
  json << "\"health\":" << health::snapshot_json();
  if (extra_) {
    const std::string extra = extra_();
    if (!extra.empty()) {
      json << "," << extra;
    }
  }
  json << "}";

  std::error_code ec;
  if (!state_file_.parent_path().empty()) {
    std::filesystem::create_directories(state_file_.parent_path(), ec);
  }
  const auto temp_path = state_file_.string() + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::trunc);
    if (!out) {
      return false;
    }
    out << json.str();
  }
  std::filesystem::rename(temp_path, state_file_, ec);
  return !ec;
}

} // namespace sandrun::daemon
