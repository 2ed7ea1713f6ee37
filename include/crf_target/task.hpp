/**
 * @file task.hpp
 * @brief Task configuration, task records and the executor seam
 *
 * @details A Task is one unit of queued work: one input file, one output
 *          file, one configuration. The Scheduler owns the records; the
 *          TaskExecutor does the work and reports through a TaskReporter.
 */

#ifndef CRF_TARGET_TASK_HPP
#define CRF_TARGET_TASK_HPP

#include <string>
#include <vector>

#include "cancellation.hpp"
#include "status.hpp"
#include "types.hpp"

namespace crf_target {

/**
 * @struct TaskConfig
 * @brief Everything needed to run one task.
 * @note preset and extra_params are opaque and passed to the encoder as-is.
 */
struct TaskConfig {
  std::string input_path;
  std::string output_path;

  Encoder encoder = Encoder::Libx265;
  Mode mode = Mode::Default;

  double target = 97.0;  //< (0, 100]
  int min_crf = 0;       //< Always 0
  int max_crf = 28;      //< >= min_crf
  int fixed_crf = -1;    //< >= 0 skips the search

  PoolMethod pool = PoolMethod::Mean;
  int vmaf_threads = 2;  //< >= 1
  int vmaf_subsample = 1; //< >= 1

  std::string pix_fmt = "yuv420p10le";
  std::string preset;
  std::string extra_params;

  double scene_split_min = 2.0;
  double scene_threshold = 0.4;
  double sample_every = 180.0;
  double sample_duration = 20.0;
  double sample_threshold = 600.0;

  int max_iterations = 8;
  double tolerance = 0.0;
  int chunk_workers = 1; //< Concurrent chunk jobs in chunked mode

  std::string work_dir;  //< Temp directory for this task's files
};

/**
 * @brief Build a configuration from the environment defaults.
 * @note Unparsable ENCODER, MODE or VMAF_POOL values fall back to libx265,
 *       default and mean with a warning.
 */
TaskConfig make_task_config(const std::string &input_path,
                            const std::string &output_path);

/**
 * @brief Check the configuration invariants.
 * @return Ok or InvalidArgument naming the first violation
 */
Status validate(const TaskConfig &config);

/// Default preset string for an encoder (PRESET_* variables)
std::string default_preset(Encoder encoder);

/// Default extra parameter string for an encoder (PARAMS_* variables)
std::string default_params(Encoder encoder);

/**
 * @brief Output file name for a folder batch entry.
 * @return "<stem>.<encoder>.vmaf<target>.<pool>.subsample<n>.<ext>"
 */
std::string output_file_name(const std::string &input_path,
                             const TaskConfig &config);

/**
 * @struct Task
 * @brief Task record as exposed to observers.
 */
struct Task {
  std::string id;
  TaskConfig config;
  TaskStatus status = TaskStatus::Queued;
  bool start_requested = false;      //< start() accepted, waiting for a slot
  std::string error;                 //< Cause when Failed
  std::vector<std::string> warnings; //< Recoverable conditions
  int selected_quality = -1;         //< Chosen parameter (default mode)
  double selected_score = 0.0;
  ProgressSnapshot progress;
};

/**
 * @class TaskReporter
 * @brief Sink for what a running task wants to publish.
 */
class TaskReporter {
public:
  virtual ~TaskReporter() = default;

  /// Replace the task's snapshot (batch and timing fields are stamped by
  /// the receiver)
  virtual void progress(const ProgressSnapshot &snapshot) = 0;

  /// Record a recoverable condition
  virtual void warning(const Status &status) = 0;

  /// Record the chosen quality parameter
  virtual void selected(int quality, double score) = 0;
};

/**
 * @class TaskExecutor
 * @brief Runs one task to completion.
 */
class TaskExecutor {
public:
  virtual ~TaskExecutor() = default;

  /**
   * @brief Execute a task.
   * @return Ok (Completed), Cancelled, or the error that failed it. Before
   *         returning on any path all external processes have exited and
   *         all temp files are deleted.
   */
  virtual Status execute(const std::string &task_id, const TaskConfig &config,
                         TaskReporter &reporter,
                         const CancelTokenPtr &token) = 0;
};

} // namespace crf_target

#endif // CRF_TARGET_TASK_HPP
