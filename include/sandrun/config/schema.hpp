#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sandrun::config {

struct SandboxConfig {
  std::string runtime = "docker";
  std::string image = "omni-operator-sandbox:latest";
  std::string container_prefix = "sandrun-sbx-";
  std::uint16_t container_port = 8003;
  std::string host = "127.0.0.1";
  std::uint16_t port_range_start = 18300;
  std::uint16_t port_range_end = 18399;
  std::vector<std::string> command;
  std::string shm_size = "2g";

  std::string health_path = "/api";
  std::string prewarm_url = "about:blank";
  std::uint32_t health_max_attempts = 30;
  std::uint64_t health_interval_ms = 1000;
  std::uint64_t health_timeout_ms = 2000;
  std::uint64_t probe_interval_ms = 5000;
  std::uint32_t probe_failure_threshold = 3;
  std::uint64_t operation_timeout_ms = 60'000;
};

struct PoolConfig {
  std::uint32_t max_size = 2;
  std::uint32_t min_ready = 0;
  std::uint64_t acquire_timeout_ms = 120'000;
  bool eager_replace = true;
};

struct QueueConfig {
  std::string db_path = "~/.sandrun/queue.db";
  std::uint64_t poll_interval_ms = 500;
  std::uint64_t visibility_timeout_secs = 300;
  std::uint32_t max_attempts = 3;
  std::uint64_t requeue_delay_ms = 1000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct WorkerConfig {
  std::string state_file = "~/.sandrun/worker_state.json";
};

struct Config {
  SandboxConfig sandbox;
  PoolConfig pool;
  QueueConfig queue;
  ObservabilityConfig observability;
  WorkerConfig worker;
};

} // namespace sandrun::config
