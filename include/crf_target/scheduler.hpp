/**
 * @file scheduler.hpp
 * @brief Task table, bounded execution and progress views
 *
 * @details The Scheduler owns every Task record. State per task:
 *
 *          Queued -> Running -> {Completed | Failed | Cancelled}
 *
 *          - MAX_CONCURRENT_TASKS worker threads pull started tasks from a
 *            ready queue, so no more than that many run at once; extra
 *            start() calls are accepted and wait for a slot
 *
 *          - progress() / progress_all() are the poll view, subscribe() is
 *            the push view; both read the same table
 *
 *          - no public call blocks on an external process except cancel(),
 *            which waits for the task's cleanup by contract
 */

#ifndef CRF_TARGET_SCHEDULER_HPP
#define CRF_TARGET_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "cancellation.hpp"
#include "scan_reporter.hpp"
#include "status.hpp"
#include "task.hpp"
#include "types.hpp"

namespace crf_target {

/// Push-view listener; called outside the scheduler lock
using ProgressListener = std::function<void(const ProgressSnapshot &)>;

/**
 * @class Scheduler
 * @brief Queue of tasks with a global concurrency bound.
 */
class Scheduler {
public:
  /**
   * @param executor Runs the tasks; must outlive the scheduler
   * @param max_concurrent Running task bound (values < 1 become 1)
   */
  Scheduler(TaskExecutor &executor, int max_concurrent);
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  // **---- Queue management ----**

  /**
   * @brief Add a task in state Queued.
   * @param id Task id; empty to generate one
   * @param assigned_id Output: the id actually used (may be null)
   * @return Ok, DuplicateTask, InvalidArgument (config invalid) or
   *         InvalidState after shutdown
   */
  Status enqueue(const std::string &id, const TaskConfig &config,
                 std::string *assigned_id = nullptr);

  /**
   * @brief Remove a Queued task record.
   * @note Running tasks must be cancelled, not removed.
   * @return Ok, NotFound or InvalidState (not Queued)
   */
  Status remove(const std::string &id);

  /**
   * @brief Request execution of a Queued task.
   * @note Accepted immediately; the task stays Queued until a slot frees.
   * @return Ok, NotFound or InvalidState (not Queued)
   */
  Status start(const std::string &id);

  /// start() every Queued task in list order
  void start_all();

  /**
   * @brief Cancel a task.
   * @details Queued: Cancelled immediately. Running: the task's token is
   *          cancelled and the call blocks until its worker has stopped
   *          every external process and deleted its temp files.
   * @return Ok, NotFound or InvalidState (Completed or Failed)
   */
  Status cancel(const std::string &id);

  // **---- Views ----**

  /// Task records in insertion order
  std::vector<Task> list() const;

  /// Current snapshot of one task
  Status progress(const std::string &id, ProgressSnapshot &out) const;

  /// Snapshots of every task in insertion order
  std::vector<ProgressSnapshot> progress_all() const;

  /**
   * @brief Register a push-view listener.
   * @return Handle for unsubscribe()
   */
  int subscribe(ProgressListener listener);
  void unsubscribe(int handle);

  // **---- Folder batches ----**

  /**
   * @brief Scan root and enqueue one task per media file.
   *
   * @param output_dir Outputs are named with output_file_name() inside it
   * @param ids Output: ids of the enqueued tasks, in discovery order
   * @return Ok, NotFound (root missing) or the first enqueue error
   */
  Status submit_folder(const std::string &root, const std::string &output_dir,
                       const TaskConfig &config_template,
                       std::vector<std::string> &ids);

  /// Files discovered by the current or last scan
  uint64_t scan_progress() const { return scan_counter.total(); }

  // **---- Lifecycle ----**

  /// Block until nothing is Running or waiting for a slot
  void wait_idle();

  /// Cancel running tasks, drop pending starts and join the workers
  void shutdown();

  int max_concurrent() const { return bound; }

  /// Tasks currently Running
  int running_count() const;

private:
  class EntryReporter;

  struct Entry {
    Task task;
    CancelTokenPtr token;
    std::chrono::steady_clock::time_point started_at;
  };

  TaskExecutor &executor;
  const int bound;

  mutable std::mutex mutex;
  std::condition_variable work_cv;  //< ready queue or stopping changed
  std::condition_variable state_cv; //< a task left Running
  std::map<std::string, Entry> entries;
  std::vector<std::string> order;
  std::deque<std::string> ready;
  int running = 0;
  bool stopping = false;
  uint64_t next_id = 0;

  std::map<int, ProgressListener> listeners;
  int next_listener = 0;

  ScanProgress scan_counter;
  std::vector<std::thread> workers;

  void worker_loop(int worker_id);
  void publish(const std::string &id, const ProgressSnapshot &snapshot);
  std::string generate_id();
};

} // namespace crf_target

#endif // CRF_TARGET_SCHEDULER_HPP
