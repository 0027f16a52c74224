#include "sandrun/sandbox/pool.hpp"

#include "sandrun/common/ids.hpp"
#include "sandrun/common/json_util.hpp"
#include "sandrun/observability/global.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace sandrun::sandbox {

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(50);
constexpr auto kMaintenanceTick = std::chrono::milliseconds(250);
constexpr auto kInitialBackoff = std::chrono::milliseconds(500);
constexpr auto kMaxBackoff = std::chrono::milliseconds(30'000);
constexpr auto kLeaseWaitLog = std::chrono::seconds(5);

bool is_booting(const SandboxState state) {
  return state == SandboxState::Starting || state == SandboxState::HealthPolling ||
         state == SandboxState::PreWarming;
}

} // namespace

// --- lease -------------------------------------------------------------------

SandboxLease::SandboxLease(SandboxPool *pool, SandboxProcess *process)
    : pool_(pool), process_(process) {}

SandboxLease::SandboxLease(SandboxLease &&other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)),
      process_(std::exchange(other.process_, nullptr)) {}

SandboxLease &SandboxLease::operator=(SandboxLease &&other) noexcept {
  if (this != &other) {
    release(false);
    pool_ = std::exchange(other.pool_, nullptr);
    process_ = std::exchange(other.process_, nullptr);
  }
  return *this;
}

SandboxLease::~SandboxLease() { release(false); }

const std::string &SandboxLease::sandbox_id() const {
  static const std::string empty;
  return process_ == nullptr ? empty : process_->id();
}

SandboxProcess &SandboxLease::sandbox() const {
  if (process_ == nullptr) {
    throw std::logic_error("sandbox lease is not held");
  }
  return *process_;
}

std::shared_ptr<const common::CancelToken> SandboxLease::lost_token() const {
  return process_ == nullptr ? nullptr : process_->lost_token();
}

void SandboxLease::release(const bool healthy) {
  if (process_ == nullptr || pool_ == nullptr) {
    return;
  }
  auto *pool = std::exchange(pool_, nullptr);
  const std::string sandbox_id = std::exchange(process_, nullptr)->id();
  const auto status = pool->release_sandbox(sandbox_id, healthy);
  if (!status.ok()) {
    std::cerr << "[pool] release of " << sandbox_id << " failed: " << status.error() << "\n";
  }
}

// --- snapshot ----------------------------------------------------------------

std::size_t PoolSnapshot::count(const SandboxState state) const {
  return static_cast<std::size_t>(
      std::count_if(sandboxes.begin(), sandboxes.end(),
                    [state](const SandboxInfo &info) { return info.state == state; }));
}

// --- pool --------------------------------------------------------------------

SandboxPool::SandboxPool(config::PoolConfig config, SandboxFactory factory,
                         IdGenerator next_id)
    : config_(config), factory_(std::move(factory)), next_id_(std::move(next_id)) {
  if (!next_id_) {
    next_id_ = []() { return common::make_id("sbx"); };
  }
  maintenance_ = std::thread([this]() { maintenance_loop(); });
}

SandboxPool::~SandboxPool() { shutdown(); }

void SandboxPool::on_sandbox_state(const std::string &sandbox_id, const SandboxState state) {
  if (state != SandboxState::Ready && state != SandboxState::Failed) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (state == SandboxState::Ready) {
    boot_failures_ = 0;
    next_spawn_at_ = {};
    publish_size_locked();
    available_cv_.notify_all();
    return;
  }

  const auto it = sandboxes_.find(sandbox_id);
  if (it == sandboxes_.end()) {
    return;
  }
  ProcessPtr process = std::move(it->second);
  sandboxes_.erase(it);

  const auto kind = process->failure_kind();
  if (kind == common::ErrorKind::LaunchError || kind == common::ErrorKind::HealthCheckTimeout) {
    ++boot_failures_;
    auto backoff = kInitialBackoff;
    for (std::uint32_t i = 1; i < boot_failures_ && backoff < kMaxBackoff; ++i) {
      backoff = std::min(backoff * 2, kMaxBackoff);
    }
    next_spawn_at_ = std::chrono::steady_clock::now() + backoff;
  }

  if (leased_.contains(sandbox_id)) {
    retired_.emplace(sandbox_id, std::move(process));
  } else {
    doomed_.push_back(std::move(process));
  }
  std::cerr << "[pool] removed failed sandbox " << sandbox_id << "\n";
  schedule_replacement_locked();
  publish_size_locked();
  maintenance_cv_.notify_all();
  available_cv_.notify_all();
}

bool SandboxPool::can_spawn_locked() const {
  return !stopping_ && sandboxes_.size() < config_.max_size &&
         std::chrono::steady_clock::now() >= next_spawn_at_;
}

std::size_t SandboxPool::booting_locked() const {
  return static_cast<std::size_t>(
      std::count_if(sandboxes_.begin(), sandboxes_.end(),
                    [](const auto &entry) { return is_booting(entry.second->state()); }));
}

bool SandboxPool::spawn_locked() {
  if (!can_spawn_locked()) {
    return false;
  }
  // Ids stay unique across live, leased and retired sandboxes.
  std::string sandbox_id = next_id_();
  while (sandboxes_.count(sandbox_id) != 0 || retired_.count(sandbox_id) != 0 ||
         leased_.count(sandbox_id) != 0) {
    sandbox_id = next_id_();
  }
  auto process = factory_(sandbox_id, [this](const std::string &id, const SandboxState state) {
    on_sandbox_state(id, state);
  });
  if (process == nullptr) {
    std::cerr << "[pool] sandbox factory returned no instance for " << sandbox_id << "\n";
    return false;
  }
  const auto [it, inserted] = sandboxes_.try_emplace(sandbox_id, std::move(process));
  if (!inserted) {
    return false;
  }
  it->second->spawn_supervisor();
  return true;
}

void SandboxPool::schedule_replacement_locked() {
  if (!config_.eager_replace || stopping_) {
    return;
  }
  ++pending_replacements_;
  maintenance_cv_.notify_all();
}

void SandboxPool::publish_size_locked() const {
  observability::PoolSizeMetric metric;
  metric.total = sandboxes_.size();
  for (const auto &[id, process] : sandboxes_) {
    const auto state = process->state();
    if (state == SandboxState::Ready) {
      ++metric.ready;
    } else if (state == SandboxState::InUse) {
      ++metric.in_use;
    }
  }
  observability::record_metric(metric);
}

void SandboxPool::terminate_all(std::vector<ProcessPtr> &processes) {
  for (auto &process : processes) {
    process->terminate();
  }
  processes.clear();
}

common::Result<SandboxLease> SandboxPool::acquire_sandbox(const std::chrono::milliseconds timeout,
                                                          const common::CancelScope *cancel) {
  using Out = common::Result<SandboxLease>;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  std::unique_lock<std::mutex> lock(mutex_);
  const std::uint64_t ticket = next_ticket_++;
  waiters_.push_back(ticket);
  const auto leave = [this, ticket]() {
    waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), ticket), waiters_.end());
    available_cv_.notify_all();
  };

  while (true) {
    if (stopping_ || (cancel != nullptr && cancel->cancelled())) {
      leave();
      return Out::failure(common::ErrorKind::Cancelled, "sandbox acquisition cancelled");
    }

    if (waiters_.front() == ticket) {
      for (auto &[id, process] : sandboxes_) {
        if (process->state() == SandboxState::Ready && process->acquire().ok()) {
          leased_.insert(id);
          waiters_.pop_front();
          available_cv_.notify_all();
          publish_size_locked();
          return Out::success(SandboxLease(this, process.get()));
        }
      }
    }

    // One booting sandbox per waiter, within capacity.
    if (booting_locked() < waiters_.size()) {
      (void)spawn_locked();
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      leave();
      return Out::failure(common::ErrorKind::PoolExhausted,
                          "no ready sandbox within " + std::to_string(timeout.count()) + "ms");
    }
    // Sliced so cancellation and spawn backoff are observed without a notification.
    available_cv_.wait_until(lock, std::min(deadline, now + kWaitSlice));
  }
}

common::Status SandboxPool::release_sandbox(const std::string &sandbox_id, const bool healthy) {
  std::vector<ProcessPtr> to_terminate;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    leased_.erase(sandbox_id);

    if (const auto retired = retired_.find(sandbox_id); retired != retired_.end()) {
      to_terminate.push_back(std::move(retired->second));
      retired_.erase(retired);
    } else if (const auto it = sandboxes_.find(sandbox_id); it != sandboxes_.end()) {
      const bool returned = healthy && it->second->release().ok();
      if (!returned) {
        to_terminate.push_back(std::move(it->second));
        sandboxes_.erase(it);
        schedule_replacement_locked();
      }
    } else {
      return common::Status::error(common::ErrorKind::NotReady,
                                   "unknown sandbox " + sandbox_id);
    }
    publish_size_locked();
    available_cv_.notify_all();
  }

  if (!to_terminate.empty()) {
    std::cerr << "[pool] discarding sandbox " << sandbox_id
              << (healthy ? " (lost)" : " (released unhealthy)") << "\n";
  }
  terminate_all(to_terminate);
  return common::Status::success();
}

void SandboxPool::warm(const std::size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t i = 0; i < count; ++i) {
    if (!spawn_locked()) {
      break;
    }
  }
}

void SandboxPool::maintenance_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    maintenance_cv_.wait_for(lock, kMaintenanceTick, [this]() {
      return stopping_ || !doomed_.empty() ||
             (pending_replacements_ > 0 &&
              (sandboxes_.size() >= config_.max_size || can_spawn_locked()));
    });
    if (stopping_) {
      return;
    }

    while (pending_replacements_ > 0) {
      if (sandboxes_.size() >= config_.max_size) {
        pending_replacements_ = 0;
        break;
      }
      if (!spawn_locked()) {
        break;
      }
      --pending_replacements_;
    }

    if (!doomed_.empty()) {
      auto doomed = std::move(doomed_);
      doomed_.clear();
      lock.unlock();
      terminate_all(doomed);
      lock.lock();
    }
  }
}

PoolSnapshot SandboxPool::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PoolSnapshot out;
  out.max_size = config_.max_size;
  out.waiting = waiters_.size();
  out.retired = retired_.size();
  out.sandboxes.reserve(sandboxes_.size());
  for (const auto &[id, process] : sandboxes_) {
    out.sandboxes.push_back(SandboxInfo{.id = id,
                                        .state = process->state(),
                                        .prewarmed = process->prewarmed(),
                                        .leased = leased_.contains(id),
                                        .consecutive_failures = process->consecutive_failures(),
                                        .base_url = process->base_url(),
                                        .last_error = process->last_error()});
  }
  std::sort(out.sandboxes.begin(), out.sandboxes.end(),
            [](const SandboxInfo &a, const SandboxInfo &b) { return a.id < b.id; });
  return out;
}

std::string SandboxPool::snapshot_json() const {
  const auto snap = snapshot();
  std::ostringstream json;
  json << "{\"max_size\":" << snap.max_size << ",\"size\":" << snap.sandboxes.size()
       << ",\"waiting\":" << snap.waiting << ",\"retired\":" << snap.retired
       << ",\"sandboxes\":[";
  for (std::size_t i = 0; i < snap.sandboxes.size(); ++i) {
    const auto &info = snap.sandboxes[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"id\":\"" << common::json_escape(info.id) << "\",";
    json << "\"state\":\"" << sandbox_state_to_string(info.state) << "\",";
    json << "\"prewarmed\":" << (info.prewarmed ? "true" : "false") << ",";
    json << "\"leased\":" << (info.leased ? "true" : "false") << ",";
    json << "\"consecutive_failures\":" << info.consecutive_failures << ",";
    json << "\"base_url\":\"" << common::json_escape(info.base_url) << "\"";
    if (!info.last_error.empty()) {
      json << ",\"last_error\":\"" << common::json_escape(info.last_error) << "\"";
    }
    json << "}";
  }
  json << "]}";
  return json.str();
}

std::size_t SandboxPool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sandboxes_.size();
}

void SandboxPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    pending_replacements_ = 0;
  }
  available_cv_.notify_all();
  maintenance_cv_.notify_all();
  if (maintenance_.joinable()) {
    try {
      maintenance_.join();
    } catch (const std::system_error &err) {
      std::cerr << "[pool] maintenance join failed: " << err.what() << "\n";
    }
  }

  std::vector<ProcessPtr> idle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sandboxes_.begin(); it != sandboxes_.end();) {
      if (leased_.contains(it->first)) {
        ++it;
        continue;
      }
      idle.push_back(std::move(it->second));
      it = sandboxes_.erase(it);
    }
    for (auto &process : doomed_) {
      idle.push_back(std::move(process));
    }
    doomed_.clear();
  }
  terminate_all(idle);

  // Leased sandboxes stay owned until their runs hand them back.
  std::unique_lock<std::mutex> lock(mutex_);
  while (!leased_.empty()) {
    if (!available_cv_.wait_for(lock, kLeaseWaitLog, [this]() { return leased_.empty(); })) {
      std::cerr << "[pool] shutdown waiting for " << leased_.size() << " leased sandbox(es)\n";
    }
  }
  std::vector<ProcessPtr> remaining;
  for (auto &[id, process] : sandboxes_) {
    remaining.push_back(std::move(process));
  }
  for (auto &[id, process] : retired_) {
    remaining.push_back(std::move(process));
  }
  sandboxes_.clear();
  retired_.clear();
  lock.unlock();
  terminate_all(remaining);
}

} // namespace sandrun::sandbox
