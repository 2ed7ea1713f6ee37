/**
 * @file process.hpp
 * @brief External process execution with streamed stderr and cancellation
 *
 * @details All encode, measurement, scene detection and stream copy work is
 *          done by external FFmpeg processes. run_process() is the single
 *          place they are started:
 *
 *          - argv is executed directly (no shell, no quoting issues)
 *
 *          - stderr is split on '\n' and '\r' and delivered line by line
 *
 *          - the child runs in its own process group; cancellation sends
 *            SIGTERM to the group, then SIGKILL after a grace period, and
 *            reaps the child before returning
 */

#ifndef CRF_TARGET_PROCESS_HPP
#define CRF_TARGET_PROCESS_HPP

#include <chrono>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "status.hpp"

namespace crf_target {

/// Receives one stderr line (without terminator)
using LineCallback = std::function<void(const std::string &line)>;

/**
 * @struct ProcessResult
 * @brief Outcome of one external process run.
 */
struct ProcessResult {
  int exit_code = -1;                //< Exit status, 128+N if killed by signal
  bool cancelled = false;            //< Terminated because of the token
  std::deque<std::string> stderr_tail; //< Last lines of stderr for diagnostics

  /// stderr tail joined with " | "
  std::string tail_text() const;
};

/**
 * @struct ProcessOptions
 * @brief Optional knobs for run_process().
 */
struct ProcessOptions {
  std::string stdout_path;  //< Redirect stdout to this file (empty = /dev/null)
  size_t tail_lines = 20;   //< stderr lines kept in ProcessResult
  std::chrono::milliseconds kill_grace{2000}; //< SIGTERM -> SIGKILL delay
};

/**
 * @brief Run an external program to completion or cancellation.
 *
 * @param argv Program and arguments (argv[0] is looked up in PATH)
 * @param on_line Called for each stderr line (may be empty)
 * @param token Cancellation token (may be null)
 * @param result Output: exit status and stderr tail
 * @param options Redirection and termination options
 * @return Ok when the process ran and exited 0, Cancelled when the token
 *         fired, ProcessFailed when it could not be started or exited
 *         non-zero
 */
Status run_process(const std::vector<std::string> &argv,
                   const LineCallback &on_line, const CancelTokenPtr &token,
                   ProcessResult &result,
                   const ProcessOptions &options = ProcessOptions());

/// argv joined for logging, arguments with spaces in double quotes
std::string format_command(const std::vector<std::string> &argv);

/**
 * @brief Split a pass-through parameter string on whitespace.
 * @note Preset and extra parameter strings are opaque to the core.
 */
std::vector<std::string> split_args(const std::string &params);

} // namespace crf_target

#endif // CRF_TARGET_PROCESS_HPP
