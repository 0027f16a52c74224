#pragma once

#include "sandrun/common/result.hpp"
#include "sandrun/config/schema.hpp"
#include "sandrun/daemon/pid_file.hpp"
#include "sandrun/daemon/state_writer.hpp"
#include "sandrun/http/client.hpp"
#include "sandrun/queue/job_queue.hpp"
#include "sandrun/queue/status_store.hpp"
#include "sandrun/sandbox/launcher.hpp"
#include "sandrun/sandbox/pool.hpp"
#include "sandrun/worker/consumer.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace sandrun::worker {

struct WorkerDependencies {
  std::shared_ptr<sandbox::ISandboxLauncher> launcher;
  std::shared_ptr<http::HttpClient> http;
};

class WorkerDaemon {
public:
  explicit WorkerDaemon(config::Config config, WorkerDependencies deps = {});
  ~WorkerDaemon();

  WorkerDaemon(const WorkerDaemon &) = delete;
  WorkerDaemon &operator=(const WorkerDaemon &) = delete;

  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool is_running() const { return running_.load(); }

  [[nodiscard]] std::filesystem::path state_file() const;
  [[nodiscard]] std::filesystem::path pid_file() const;

  [[nodiscard]] std::string extra_state() const;

private:
  void teardown();

  config::Config config_;
  WorkerDependencies deps_;

  mutable std::mutex mutex_;
  std::unique_ptr<daemon::PidFile> pid_;
  std::unique_ptr<queue::SqliteJobQueue> queue_;
  std::unique_ptr<queue::SqliteStatusStore> status_;
  std::unique_ptr<sandbox::SandboxPool> pool_;
  std::unique_ptr<JobQueueConsumer> consumer_;
  std::unique_ptr<daemon::StateWriter> writer_;
  std::atomic<bool> running_{false};
};

} // namespace sandrun::worker
