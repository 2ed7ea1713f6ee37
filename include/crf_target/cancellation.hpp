/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation tokens
 *
 * @details A CancelToken is shared between the code that requests
 *          cancellation (Scheduler, Chunk Pipeline) and the code that must
 *          observe it (process runner, search loop, chunk workers).
 *
 *          - Tokens form a tree: cancelling a parent cancels every child
 *
 *          - Cancelling a child does not affect its parent or siblings
 *
 *          - wait_for() is an interruptible sleep used by polling loops
 */

#ifndef CRF_TARGET_CANCELLATION_HPP
#define CRF_TARGET_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace crf_target {

class CancelToken {
  /// Restricts construction to create() while keeping make_shared usable
  struct Key {
    explicit Key() = default;
  };

public:
  explicit CancelToken(Key) {}

  static std::shared_ptr<CancelToken> create();

  /// New token that is cancelled whenever this one is
  std::shared_ptr<CancelToken> make_child();

  /// Request cancellation of this token and all of its children
  void cancel();

  bool is_cancelled() const { return cancelled.load(); }

  /**
   * @brief Sleep up to timeout, waking early on cancellation.
   * @return true if cancelled
   */
  bool wait_for(std::chrono::milliseconds timeout);

private:
  std::atomic<bool> cancelled{false};
  std::mutex mutex;
  std::condition_variable cv;
  std::vector<std::weak_ptr<CancelToken>> children;
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

} // namespace crf_target

#endif // CRF_TARGET_CANCELLATION_HPP
