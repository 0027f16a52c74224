#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace sandrun::worker {

class WorkerPool {
public:
  using Task = std::function<void()>;

  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  [[nodiscard]] bool try_submit(Task task);

  [[nodiscard]] bool wait_for_slot(std::chrono::milliseconds timeout);

  void wait_idle();

  void stop();

  [[nodiscard]] std::size_t busy() const;
  [[nodiscard]] std::size_t size() const { return threads_.size(); }

private:
  void worker_loop();

  mutable std::mutex mutex_;
  std::condition_variable task_cv_;
  std::condition_variable slot_cv_;
  std::deque<Task> tasks_;
  std::size_t capacity_;
  std::size_t busy_ = 0;
  bool stopping_ = false;
  std::vector<std::thread> threads_;
};

} // namespace sandrun::worker
