#include "sandrun/worker/worker_pool.hpp"

#include <iostream>
#include <system_error>

namespace sandrun::worker {

WorkerPool::WorkerPool(const std::size_t threads) : capacity_(threads == 0 ? 1 : threads) {
  threads_.reserve(capacity_);
  for (std::size_t i = 0; i < capacity_; ++i) {
    threads_.emplace_back([this]() { worker_loop(); });
  }
}

WorkerPool::~WorkerPool() { stop(); }

bool WorkerPool::try_submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || busy_ >= capacity_) {
      return false;
    }
    ++busy_;
    tasks_.push_back(std::move(task));
  }
  task_cv_.notify_one();
  return true;
}

bool WorkerPool::wait_for_slot(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return slot_cv_.wait_for(lock, timeout, [this]() { return stopping_ || busy_ < capacity_; }) &&
         !stopping_;
}

void WorkerPool::wait_idle() {
  std::unique_lock<std::mutex> lock(mutex_);
  slot_cv_.wait(lock, [this]() { return busy_ == 0; });
}

void WorkerPool::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  task_cv_.notify_all();
  slot_cv_.notify_all();
  for (auto &thread : threads_) {
    if (!thread.joinable()) {
      continue;
    }
    try {
      thread.join();
    } catch (const std::system_error &err) {
      std::cerr << "[worker] join failed: " << err.what() << "\n";
    }
  }
}

std::size_t WorkerPool::busy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return busy_;
}

void WorkerPool::worker_loop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      task_cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
      if (tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }

    try {
      task();
    } catch (const std::exception &ex) {
      std::cerr << "[worker] task failed: " << ex.what() << "\n";
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --busy_;
    }
    slot_cv_.notify_all();
  }
}

} // namespace sandrun::worker
