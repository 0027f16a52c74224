#include "sandrun/common/cancel.hpp"

#include <algorithm>
#include <thread>

namespace sandrun::common {

namespace {

constexpr std::chrono::milliseconds kScopeSlice{20};

} // namespace

void CancelToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancelToken::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool CancelToken::wait_for(const std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, duration, [this] { return cancelled_; });
}

CancelScope::CancelScope(std::initializer_list<std::shared_ptr<const CancelToken>> tokens) {
  for (const auto &token : tokens) {
    add(token);
  }
}

void CancelScope::add(std::shared_ptr<const CancelToken> token) {
  if (token != nullptr) {
    tokens_.push_back(std::move(token));
  }
}

bool CancelScope::cancelled() const {
  return std::any_of(tokens_.begin(), tokens_.end(),
                     [](const auto &token) { return token->cancelled(); });
}

bool CancelScope::wait_for(const std::chrono::milliseconds duration) const {
  if (tokens_.empty()) {
    std::this_thread::sleep_for(duration);
    return false;
  }
  if (tokens_.size() == 1) {
    return tokens_.front()->wait_for(duration);
  }

  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (!cancelled()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    (void)tokens_.front()->wait_for(std::min(remaining, kScopeSlice));
  }
  return true;
}

} // namespace sandrun::common
