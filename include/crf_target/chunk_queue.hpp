/**
 * @file chunk_queue.hpp
 * @brief Thread-safe chunk queue and result collection
 *
 * @details Provides:
 *          - ChunkQueue: Shared queue chunk workers pull from
 *
 *          - ChunkResultCollector: Thread-safe aggregator for chunk outcomes
 */

#ifndef CRF_TARGET_CHUNK_QUEUE_HPP
#define CRF_TARGET_CHUNK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

#include "types.hpp"

namespace crf_target {

/**
 * @class ChunkQueue
 * @brief Thread-safe queue for dynamic load balancing of chunk jobs.
 *
 * @attention DESIGN:
 *
 * - Workers pop chunks from a shared queue
 *
 * - If one worker gets a "hard" chunk (long search), others continue
 *
 * - finish() lets idle workers exit; clear() drops everything not yet
 *   started (used when a sibling chunk fails)
 */
class ChunkQueue {
  std::queue<ChunkDescriptor> chunks;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a chunk to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(const ChunkDescriptor &chunk);

  /**
   * @brief Pop a chunk from the queue.
   * @note Blocks until a chunk is available or queue is finished.
   * @param chunk Output parameter for the chunk
   * @return true if a chunk was retrieved, false if queue is empty and done
   */
  bool pop(ChunkDescriptor &chunk);

  /**
   * @brief Signal that no more chunks will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();

  /// Drop all pending chunks and finish
  void clear();
};

/**
 * @struct ChunkOutcome
 * @brief Result of one finished chunk job.
 */
struct ChunkOutcome {
  int index = 0;
  std::string output_path;
  int quality = 0;
  double score = 0.0;     //< 0 when encoded at a fixed quality
  bool target_met = true;
  uint64_t frames = 0;    //< Frames written by the final chunk encode
};

/**
 * @class ChunkResultCollector
 * @brief Thread-safe aggregator for chunk outcomes.
 * @note Outcomes arrive in completion order; extract() returns them in
 *       sequence-index order.
 */
class ChunkResultCollector {
  std::vector<ChunkOutcome> outcomes;
  std::mutex mutex;

public:
  /**
   * @brief Pre-allocate space for expected results.
   */
  void reserve(size_t n);

  /**
   * @brief Add the outcome of a worker.
   */
  void add(ChunkOutcome &&outcome);

  /**
   * @brief Extract all collected outcomes sorted by index.
   * @attention Moves the internal vector out, leaving collector empty.
   */
  std::vector<ChunkOutcome> extract();
};

} // namespace crf_target

#endif // CRF_TARGET_CHUNK_QUEUE_HPP
