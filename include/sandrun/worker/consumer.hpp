#pragma once

#include "sandrun/common/cancel.hpp"
#include "sandrun/config/schema.hpp"
#include "sandrun/queue/job_queue.hpp"
#include "sandrun/queue/status_store.hpp"
#include "sandrun/run/executor.hpp"
#include "sandrun/sandbox/pool.hpp"
#include "sandrun/worker/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace sandrun::worker {

struct ConsumerOptions {
  std::chrono::milliseconds poll_interval{500};
  std::uint32_t max_attempts = 3;
  std::chrono::milliseconds requeue_delay{1000};
  std::chrono::milliseconds acquire_timeout{120'000};
  std::chrono::milliseconds lease_refresh{100'000};
  std::size_t workers = 2;

  [[nodiscard]] static ConsumerOptions from_config(const config::Config &config);
};

struct ConsumerStats {
  std::uint64_t received = 0;
  std::uint64_t duplicates = 0;
  std::uint64_t succeeded = 0;
  std::uint64_t failed = 0;
  std::uint64_t requeued = 0;
};

/// Receives jobs, drops redeliveries of runs already in flight and hands the rest to a
/// bounded set of worker threads, one RunExecutor each. A delivery is acknowledged only
/// once its run is terminal; retryable outcomes are requeued with the next attempt until
/// `max_attempts` is spent.
class JobQueueConsumer {
public:
  JobQueueConsumer(queue::IJobQueue &queue, queue::IStatusStore &status,
                   sandbox::SandboxPool &pool, ConsumerOptions options);
  ~JobQueueConsumer();

  JobQueueConsumer(const JobQueueConsumer &) = delete;
  JobQueueConsumer &operator=(const JobQueueConsumer &) = delete;

  void start();

  void stop();

  bool poll_once();

  void wait_idle();

  void refresh_leases();

  [[nodiscard]] bool is_running() const { return running_.load(); }
  [[nodiscard]] std::size_t in_flight() const;
  [[nodiscard]] ConsumerStats stats() const;
  [[nodiscard]] std::string stats_json() const;

private:
  void run_loop();
  void process(const queue::Delivery &delivery);
  void settle(const queue::Delivery &delivery, const run::RunOutcome &outcome);
  void requeue(const queue::Delivery &delivery, std::uint32_t attempt,
               std::chrono::milliseconds delay, const std::string &reason);
  void acknowledge(const queue::Delivery &delivery);
  void report(const queue::Job &job, queue::RunState state, const std::string &detail,
              std::uint32_t attempt);
  void publish_in_flight_locked() const;

  queue::IJobQueue &queue_;
  queue::IStatusStore &status_;
  sandbox::SandboxPool &pool_;
  ConsumerOptions options_;

  std::shared_ptr<common::CancelToken> stop_token_ = std::make_shared<common::CancelToken>();
  std::shared_ptr<common::CancelToken> shutdown_token_ =
      std::make_shared<common::CancelToken>();

  mutable std::mutex mutex_;
  // run_id -> delivery currently executing it
  std::unordered_map<std::string, std::int64_t> in_flight_;
  ConsumerStats stats_;

  WorkerPool workers_;
  std::atomic<bool> running_{false};
  std::thread loop_;
};

} // namespace sandrun::worker
