/**
 * @file chunk_queue.cpp
 * @brief Thread-safe chunk queue and result collection implementation
 *
 * @details Provides implementations for:
 *
 *          - ChunkQueue: Shared queue for dynamic load balancing
 *
 *          - ChunkResultCollector: Thread-safe aggregator for chunk outcomes
 */

#include "crf_target/chunk_queue.hpp"

#include <algorithm>
#include <utility>

namespace crf_target {

// **----- ChunkQueue Implementation -----**

void ChunkQueue::push(const ChunkDescriptor &chunk) {
  std::lock_guard<std::mutex> lock(mutex);
  chunks.push(chunk);
  cv.notify_one();
}

bool ChunkQueue::pop(ChunkDescriptor &chunk) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !chunks.empty() || done.load(); });
  if (chunks.empty())
    return false;
  chunk = chunks.front();
  chunks.pop();
  return true;
}

void ChunkQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

void ChunkQueue::clear() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    std::queue<ChunkDescriptor>().swap(chunks);
    done.store(true);
  }
  cv.notify_all();
}

// **----- ChunkResultCollector Implementation -----**

void ChunkResultCollector::reserve(size_t n) {
  std::lock_guard<std::mutex> lock(mutex);
  outcomes.reserve(n);
}

void ChunkResultCollector::add(ChunkOutcome &&outcome) {
  std::lock_guard<std::mutex> lock(mutex);
  outcomes.push_back(std::move(outcome));
}

std::vector<ChunkOutcome> ChunkResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex);
  std::vector<ChunkOutcome> out = std::move(outcomes);
  outcomes.clear();
  std::sort(out.begin(), out.end(),
            [](const ChunkOutcome &a, const ChunkOutcome &b) {
              return a.index < b.index;
            });
  return out;
}

} // namespace crf_target
