/**
 * @file cancellation.cpp
 * @brief Cooperative cancellation tokens implementation
 */

#include "crf_target/cancellation.hpp"

namespace crf_target {

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>(Key{});
}

std::shared_ptr<CancelToken> CancelToken::make_child() {
  auto child = create();
  std::lock_guard<std::mutex> lock(mutex);
  if (cancelled.load()) {
    child->cancel();
  } else {
    children.push_back(child);
  }
  return child;
}

void CancelToken::cancel() {
  std::vector<std::weak_ptr<CancelToken>> pending;
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (cancelled.exchange(true))
      return;
    pending.swap(children);
  }
  cv.notify_all();

  /// Propagate outside the lock (children take their own)
  for (auto &weak : pending) {
    if (auto child = weak.lock())
      child->cancel();
  }
}

bool CancelToken::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait_for(lock, timeout, [this] { return cancelled.load(); });
  return cancelled.load();
}

} // namespace crf_target
