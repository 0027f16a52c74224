#pragma once

#include <chrono>
#include <condition_variable>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <vector>

namespace sandrun::common {

/// One-shot cancellation flag shared between a requester and any number of waiters.
class CancelToken {
public:
  void cancel();
  [[nodiscard]] bool cancelled() const;

  bool wait_for(std::chrono::milliseconds duration) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
};

class CancelScope {
public:
  CancelScope() = default;
  CancelScope(std::initializer_list<std::shared_ptr<const CancelToken>> tokens);

  void add(std::shared_ptr<const CancelToken> token);
  [[nodiscard]] bool cancelled() const;

  bool wait_for(std::chrono::milliseconds duration) const;

private:
  std::vector<std::shared_ptr<const CancelToken>> tokens_;
};

} // namespace sandrun::common
