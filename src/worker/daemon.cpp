#include "sandrun/worker/daemon.hpp"

#include "sandrun/config/config.hpp"
#include "sandrun/health/health.hpp"
#include "sandrun/observability/global.hpp"
#include "sandrun/sandbox/process.hpp"

#include <iostream>

namespace sandrun::worker {

namespace {

constexpr const char *kComponent = "worker";

} // namespace

WorkerDaemon::WorkerDaemon(config::Config config, WorkerDependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)) {}

WorkerDaemon::~WorkerDaemon() { stop(); }

std::filesystem::path WorkerDaemon::state_file() const {
  return std::filesystem::path(config::expand_config_path(config_.worker.state_file));
}

std::filesystem::path WorkerDaemon::pid_file() const {
  return state_file().parent_path() / "worker.pid";
}

common::Status WorkerDaemon::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return common::Status::error("worker already running");
  }
  health::mark_component_starting(kComponent);

  const auto fail = [this](const common::Status &status) {
    health::mark_component_error(kComponent, status.error());
    observability::record_error(kComponent, status.error());
    teardown();
    return status;
  };

  pid_ = std::make_unique<daemon::PidFile>(pid_file());
  if (auto acquired = pid_->acquire(); !acquired.ok()) {
    pid_.reset();
    health::mark_component_error(kComponent, acquired.error());
    return acquired;
  }

  const std::filesystem::path db_path = config::expand_config_path(config_.queue.db_path);
  queue_ = std::make_unique<queue::SqliteJobQueue>(
      db_path, std::chrono::seconds(config_.queue.visibility_timeout_secs));
  if (auto opened = queue_->open(); !opened.ok()) {
    return fail(opened);
  }
  status_ = std::make_unique<queue::SqliteStatusStore>(db_path);
  if (auto opened = status_->open(); !opened.ok()) {
    return fail(opened);
  }

  auto launcher = deps_.launcher;
  if (launcher == nullptr) {
    auto created = sandbox::create_launcher(config_.sandbox);
    if (!created.ok()) {
      return fail(created.status());
    }
    launcher = created.value();
  }
  std::shared_ptr<http::HttpClient> http = deps_.http;
  if (http == nullptr) {
    http = std::make_shared<http::CurlHttpClient>();
  }

  pool_ = std::make_unique<sandbox::SandboxPool>(
      config_.pool,
      [sandbox_config = config_.sandbox, launcher,
       http](const std::string &sandbox_id, sandbox::SandboxProcess::StateListener listener) {
        return std::make_unique<sandbox::SandboxProcess>(sandbox_id, sandbox_config, launcher,
                                                         http, std::move(listener));
      });
  pool_->warm(config_.pool.min_ready);

  consumer_ = std::make_unique<JobQueueConsumer>(*queue_, *status_, *pool_,
                                                 ConsumerOptions::from_config(config_));
  consumer_->start();

  writer_ = std::make_unique<daemon::StateWriter>(state_file(),
                                                  [this]() { return extra_state(); });
  writer_->start();

  running_ = true;
  health::mark_component_ok(kComponent);
  std::cerr << "[worker] started: runtime=" << config_.sandbox.runtime
            << " pool_max=" << config_.pool.max_size << " min_ready=" << config_.pool.min_ready
            << " db=" << db_path.string() << "\n";
  return common::Status::success();
}

void WorkerDaemon::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_.exchange(false)) {
    return;
  }
  std::cerr << "[worker] stopping\n";
  teardown();
  health::reset_component(kComponent);
}

void WorkerDaemon::teardown() {
  // Runs are cancelled and requeued before their sandboxes go away.
  if (consumer_ != nullptr) {
    consumer_->stop();
  }
  if (pool_ != nullptr) {
    pool_->shutdown();
  }
  if (writer_ != nullptr) {
    writer_->stop();
    // One last write so the file reflects the stopped worker.
    if (!writer_->write_state()) {
      std::cerr << "[worker] final state write failed: " << state_file().string() << "\n";
    }
  }
  writer_.reset();
  consumer_.reset();
  pool_.reset();
  status_.reset();
  queue_.reset();
  if (pid_ != nullptr) {
    pid_->release();
    pid_.reset();
  }
}

std::string WorkerDaemon::extra_state() const {
  // Called from the writer thread; the members are only replaced under stop(), which
  // joins the writer first.
  if (pool_ == nullptr || consumer_ == nullptr) {
    return "";
  }
  return "\"pool\":" + pool_->snapshot_json() + ",\"consumer\":" + consumer_->stats_json();
}

} // namespace sandrun::worker
