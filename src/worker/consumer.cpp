#include "sandrun/worker/consumer.hpp"

#include "sandrun/common/fs.hpp"
#include "sandrun/health/health.hpp"
#include "sandrun/observability/global.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <system_error>
#include <vector>

namespace sandrun::worker {

namespace {

constexpr const char *kComponent = "consumer";

bool is_retryable(const run::RunOutcome &outcome) {
  switch (outcome.error_kind) {
  case common::ErrorKind::PoolExhausted:
  case common::ErrorKind::SandboxLost:
  case common::ErrorKind::ExecutionFault:
    return true;
  default:
    return false;
  }
}

} // namespace

ConsumerOptions ConsumerOptions::from_config(const config::Config &config) {
  ConsumerOptions options;
  options.poll_interval = std::chrono::milliseconds(config.queue.poll_interval_ms);
  options.max_attempts = config.queue.max_attempts;
  options.requeue_delay = std::chrono::milliseconds(config.queue.requeue_delay_ms);
  options.acquire_timeout = std::chrono::milliseconds(config.pool.acquire_timeout_ms);
  // Refresh well before the visibility timeout lapses.
  options.lease_refresh = std::max<std::chrono::milliseconds>(
      std::chrono::milliseconds(1000),
      std::chrono::seconds(config.queue.visibility_timeout_secs) / 3);
  options.workers = std::max<std::size_t>(1, config.pool.max_size);
  return options;
}

JobQueueConsumer::JobQueueConsumer(queue::IJobQueue &queue, queue::IStatusStore &status,
                                   sandbox::SandboxPool &pool, ConsumerOptions options)
    : queue_(queue), status_(status), pool_(pool), options_(options),
      workers_(options_.workers) {}

JobQueueConsumer::~JobQueueConsumer() { stop(); }

void JobQueueConsumer::start() {
  if (running_.exchange(true)) {
    return;
  }
  health::mark_component_starting(kComponent);
  loop_ = std::thread([this]() { run_loop(); });
}

void JobQueueConsumer::stop() {
  stop_token_->cancel();
  if (loop_.joinable()) {
    try {
      loop_.join();
    } catch (const std::system_error &err) {
      std::cerr << "[consumer] loop join failed: " << err.what() << "\n";
    }
  }

  shutdown_token_->cancel();
  if (in_flight() > 0) {
    std::cerr << "[consumer] waiting for " << in_flight() << " in-flight run(s)\n";
  }
  workers_.wait_idle();
  workers_.stop();
  if (running_.exchange(false)) {
    health::reset_component(kComponent);
  }
}

void JobQueueConsumer::run_loop() {
  health::mark_component_ok(kComponent);
  auto last_refresh = std::chrono::steady_clock::now();

  while (!stop_token_->cancelled()) {
    const auto now = std::chrono::steady_clock::now();
    if (now - last_refresh >= options_.lease_refresh) {
      refresh_leases();
      last_refresh = now;
    }
    // Backlog stays in the queue while every worker is busy.
    if (!workers_.wait_for_slot(options_.poll_interval)) {
      continue;
    }
    if (stop_token_->cancelled()) {
      break;
    }
    if (!poll_once()) {
      stop_token_->wait_for(options_.poll_interval);
    }
  }
}

bool JobQueueConsumer::poll_once() {
  if (stop_token_->cancelled()) {
    return false;
  }
  if (workers_.busy() >= workers_.size()) {
    return false;
  }

  auto received = queue_.receive();
  if (!received.ok()) {
    std::cerr << "[consumer] receive failed: " << received.error() << "\n";
    observability::record_error(kComponent, received.error());
    health::mark_component_error(kComponent, received.error());
    return false;
  }
  health::mark_component_ok(kComponent);
  if (!received.value().has_value()) {
    return false;
  }

  const queue::Delivery delivery = *received.value();
  bool duplicate = false;
  bool same_delivery = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.received;
    const auto found = in_flight_.find(delivery.job.run_id);
    duplicate = found != in_flight_.end();
    if (duplicate) {
      ++stats_.duplicates;
      same_delivery = found->second == delivery.delivery_id;
    } else {
      in_flight_.emplace(delivery.job.run_id, delivery.delivery_id);
      publish_in_flight_locked();
    }
  }

  if (duplicate) {
    std::cerr << "[consumer] duplicate delivery " << delivery.delivery_id << " for run "
              << delivery.job.run_id << " dropped\n";
    observability::record_duplicate_delivery(delivery.job.run_id, delivery.delivery_id);
    if (same_delivery) {
      // Our own lease lapsed; the running worker still owns the row.
      const auto extended = queue_.extend_lease(delivery.delivery_id);
      if (!extended.ok()) {
        std::cerr << "[consumer] lease refresh for run " << delivery.job.run_id
                  << " failed: " << extended.error() << "\n";
        observability::record_error(kComponent, extended.error());
      }
    } else {
      acknowledge(delivery);
    }
    return true;
  }

  if (!workers_.try_submit([this, delivery]() { process(delivery); })) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      in_flight_.erase(delivery.job.run_id);
      publish_in_flight_locked();
    }
    requeue(delivery, delivery.job.attempt, std::chrono::milliseconds(0),
            "no free worker");
    return false;
  }
  return true;
}

void JobQueueConsumer::process(const queue::Delivery &delivery) {
  report(delivery.job, queue::RunState::Running, "", delivery.job.attempt);

  run::RunExecutor executor(delivery.job, pool_,
                            run::ExecutorOptions{.acquire_timeout = options_.acquire_timeout},
                            shutdown_token_);
  run::RunOutcome outcome;
  try {
    outcome = executor.execute();
  } catch (const std::exception &ex) {
    outcome.state = run::ExecutionState::Failed;
    outcome.error_kind = common::ErrorKind::ExecutionFault;
    outcome.result = std::string("executor error: ") + ex.what();
  }
  // Leave the in-flight set before settling: a zero-delay requeue is receivable at once
  // and must not be mistaken for a lapsed lease of this run.
  {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(delivery.job.run_id);
    publish_in_flight_locked();
  }
  settle(delivery, outcome);
}

void JobQueueConsumer::settle(const queue::Delivery &delivery, const run::RunOutcome &outcome) {
  const auto &job = delivery.job;

  if (outcome.state == run::ExecutionState::Succeeded) {
    report(job, queue::RunState::Succeeded, outcome.result, job.attempt);
    acknowledge(delivery);
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.succeeded;
    return;
  }

  // Shutdown is not the run's fault: hand it back without spending an attempt.
  if (outcome.error_kind == common::ErrorKind::Cancelled) {
    requeue(delivery, job.attempt, std::chrono::milliseconds(0), outcome.result);
    return;
  }

  if (is_retryable(outcome) && job.attempt < options_.max_attempts) {
    report(job, queue::RunState::Running,
           "attempt " + std::to_string(job.attempt) + " " +
               std::string(common::error_kind_to_string(outcome.error_kind)) + ": " +
               outcome.result,
           job.attempt + 1);
    requeue(delivery, job.attempt + 1, options_.requeue_delay, outcome.result);
    return;
  }

  // Budget exhausted for infrastructure faults is permanent; run-level faults are failed.
  const bool permanent = outcome.error_kind == common::ErrorKind::PoolExhausted ||
                         outcome.error_kind == common::ErrorKind::SandboxLost;
  const auto state = permanent ? queue::RunState::PermanentlyFailed : queue::RunState::Failed;
  std::cerr << "[consumer] run " << job.run_id << " " << queue::run_state_to_string(state)
            << " after attempt " << job.attempt << ": " << outcome.result << "\n";
  report(job, state, outcome.result, job.attempt);
  acknowledge(delivery);
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.failed;
}

void JobQueueConsumer::requeue(const queue::Delivery &delivery, const std::uint32_t attempt,
                               const std::chrono::milliseconds delay,
                               const std::string &reason) {
  const auto status = queue_.requeue(delivery.delivery_id, attempt, delay);
  if (!status.ok()) {
    std::cerr << "[consumer] requeue of run " << delivery.job.run_id
              << " failed, lease will expire: " << status.error() << "\n";
    observability::record_error(kComponent, status.error());
    return;
  }
  observability::record_requeue(delivery.job.run_id, attempt, reason);
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.requeued;
}

void JobQueueConsumer::acknowledge(const queue::Delivery &delivery) {
  const auto status = queue_.ack(delivery.delivery_id);
  if (!status.ok()) {
    std::cerr << "[consumer] ack of delivery " << delivery.delivery_id
              << " failed: " << status.error() << "\n";
    observability::record_error(kComponent, status.error());
  }
}

void JobQueueConsumer::report(const queue::Job &job, const queue::RunState state,
                              const std::string &detail, const std::uint32_t attempt) {
  const auto status = status_.report(queue::RunStatusRecord{.run_id = job.run_id,
                                                            .state = state,
                                                            .detail = detail,
                                                            .attempt = attempt,
                                                            .updated_at_ms =
                                                                common::unix_millis()});
  if (!status.ok()) {
    std::cerr << "[consumer] status report for run " << job.run_id
              << " failed: " << status.error() << "\n";
    observability::record_error(kComponent, status.error());
  }
}

void JobQueueConsumer::refresh_leases() {
  std::vector<std::pair<std::string, std::int64_t>> deliveries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    deliveries.assign(in_flight_.begin(), in_flight_.end());
  }
  for (const auto &[run_id, delivery_id] : deliveries) {
    const auto status = queue_.extend_lease(delivery_id);
    if (!status.ok()) {
      std::cerr << "[consumer] lease refresh for run " << run_id << " failed: "
                << status.error() << "\n";
      observability::record_error(kComponent, status.error());
    }
  }
}

void JobQueueConsumer::wait_idle() { workers_.wait_idle(); }

std::size_t JobQueueConsumer::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_.size();
}

ConsumerStats JobQueueConsumer::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

std::string JobQueueConsumer::stats_json() const {
  const auto current = stats();
  std::ostringstream json;
  json << "{\"in_flight\":" << in_flight() << ",\"received\":" << current.received
       << ",\"duplicates\":" << current.duplicates << ",\"succeeded\":" << current.succeeded
       << ",\"failed\":" << current.failed << ",\"requeued\":" << current.requeued << "}";
  return json.str();
}

void JobQueueConsumer::publish_in_flight_locked() const {
  observability::record_metric(
      observability::InFlightRunsMetric{.count = static_cast<std::uint64_t>(in_flight_.size())});
}

} // namespace sandrun::worker
