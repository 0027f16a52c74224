#pragma once

#include "sandrun/common/cancel.hpp"
#include "sandrun/common/result.hpp"
#include "sandrun/config/schema.hpp"
#include "sandrun/sandbox/process.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sandrun::sandbox {

class SandboxPool;

class SandboxLease {
public:
  SandboxLease() = default;
  SandboxLease(SandboxLease &&other) noexcept;
  SandboxLease &operator=(SandboxLease &&other) noexcept;
  SandboxLease(const SandboxLease &) = delete;
  SandboxLease &operator=(const SandboxLease &) = delete;
  ~SandboxLease();

  [[nodiscard]] bool held() const { return process_ != nullptr; }
  [[nodiscard]] const std::string &sandbox_id() const;
  [[nodiscard]] SandboxProcess &sandbox() const;
  [[nodiscard]] std::shared_ptr<const common::CancelToken> lost_token() const;

  void release(bool healthy);

private:
  friend class SandboxPool;
  SandboxLease(SandboxPool *pool, SandboxProcess *process);

  SandboxPool *pool_ = nullptr;
  SandboxProcess *process_ = nullptr;
};

struct SandboxInfo {
  std::string id;
  SandboxState state = SandboxState::Starting;
  bool prewarmed = false;
  bool leased = false;
  std::uint32_t consecutive_failures = 0;
  std::string base_url;
  std::string last_error;
};

struct PoolSnapshot {
  std::size_t max_size = 0;
  std::size_t waiting = 0;
  std::size_t retired = 0;
  std::vector<SandboxInfo> sandboxes;

  [[nodiscard]] std::size_t count(SandboxState state) const;
};

class SandboxPool {
public:
  using SandboxFactory = std::function<std::unique_ptr<SandboxProcess>(
      const std::string &sandbox_id, SandboxProcess::StateListener listener)>;
  using IdGenerator = std::function<std::string()>;

  SandboxPool(config::PoolConfig config, SandboxFactory factory, IdGenerator next_id = {});
  ~SandboxPool();

  SandboxPool(const SandboxPool &) = delete;
  SandboxPool &operator=(const SandboxPool &) = delete;

  /// Ready sandbox now, a new one if below capacity, or the next one released. Fails with
  /// PoolExhausted after `timeout`, or Cancelled when `cancel` fires or the pool stops.
  [[nodiscard]] common::Result<SandboxLease>
  acquire_sandbox(std::chrono::milliseconds timeout,
                  const common::CancelScope *cancel = nullptr);

  [[nodiscard]] common::Status release_sandbox(const std::string &sandbox_id, bool healthy);

  void warm(std::size_t count);

  [[nodiscard]] PoolSnapshot snapshot() const;
  [[nodiscard]] std::string snapshot_json() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t max_size() const { return config_.max_size; }

  void shutdown();

private:
  using ProcessPtr = std::unique_ptr<SandboxProcess>;

  void on_sandbox_state(const std::string &sandbox_id, SandboxState state);
  void maintenance_loop();
  bool spawn_locked();
  [[nodiscard]] bool can_spawn_locked() const;
  [[nodiscard]] std::size_t booting_locked() const;
  void schedule_replacement_locked();
  void publish_size_locked() const;
  static void terminate_all(std::vector<ProcessPtr> &processes);

  config::PoolConfig config_;
  SandboxFactory factory_;
  IdGenerator next_id_;

  mutable std::mutex mutex_;
  std::condition_variable available_cv_;
  std::condition_variable maintenance_cv_;
  std::unordered_map<std::string, ProcessPtr> sandboxes_;
  // Failed while leased: out of capacity, still owned until the lease comes back.
  std::unordered_map<std::string, ProcessPtr> retired_;
  std::vector<ProcessPtr> doomed_;
  std::unordered_set<std::string> leased_;
  std::deque<std::uint64_t> waiters_;
  std::uint64_t next_ticket_ = 0;
  std::size_t pending_replacements_ = 0;
  std::uint32_t boot_failures_ = 0;
  std::chrono::steady_clock::time_point next_spawn_at_{};
  bool stopping_ = false;

  std::thread maintenance_;
};

} // namespace sandrun::sandbox
