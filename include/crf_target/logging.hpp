/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *            routed through log_line()
 *
 *          - Runtime-gated LOG_DEBUG (VERBOSE=1)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating stage durations
 *
 * @note Messages are formatted with fmt::format before the lock is taken;
 *       only the write itself is serialized.
 */

#ifndef CRF_TARGET_LOGGING_HPP
#define CRF_TARGET_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "config.hpp"

namespace crf_target {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp); also held by table printers
extern std::mutex log_mutex;

/// Severity and color of a log line
enum class LogLevel { Debug, Info, Warn, Error, Phase, Success };

/**
 * @brief Write one line under log_mutex and flush.
 * @details Lines are stamped with the time since process start so that
 *          interleaved task output can be ordered by eye.
 */
void log_line(LogLevel level, const std::string &text);

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  crf_target::log_line(crf_target::LogLevel::Info,                             \
                       fmt::format(format_str, ##__VA_ARGS__))

#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (crf_target::Config::verbose())                                         \
      crf_target::log_line(crf_target::LogLevel::Debug,                        \
                           fmt::format(format_str, ##__VA_ARGS__));            \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  crf_target::log_line(crf_target::LogLevel::Warn,                             \
                       fmt::format(format_str, ##__VA_ARGS__))

#define LOG_ERROR(format_str, ...)                                             \
  crf_target::log_line(crf_target::LogLevel::Error,                            \
                       fmt::format(format_str, ##__VA_ARGS__))

#define LOG_PHASE(format_str, ...)                                             \
  crf_target::log_line(crf_target::LogLevel::Phase,                            \
                       fmt::format(format_str, ##__VA_ARGS__))

#define LOG_SUCCESS(format_str, ...)                                           \
  crf_target::log_line(crf_target::LogLevel::Success,                          \
                       fmt::format(format_str, ##__VA_ARGS__))
#else
#define LOG_INFO(...) ((void)0)
#define LOG_DEBUG(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 * @note Stores the stage name and duration in microseconds.
 */
struct TimingEntry {
  std::string name;  //< Stage name (prefixed with the task id)
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe singleton for collecting timing measurements.
 * @note Search, encode and concatenation stages of every task record here.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Stage name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table.
   *        Called at the end of single-file runs.
   */
  static void print_summary();

  /**
   * @brief Copy of the collected entries.
   */
  static std::vector<TimingEntry> snapshot();

  /**
   * @brief Clear all collected timings.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

/// label is a std::string naming the stage in the summary
#define TIMER_END(name, label)                                                 \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    crf_target::TimingCollector::record(label, timer_duration_##name);         \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name, label) ((void)0)
#endif

} // namespace crf_target

#endif // CRF_TARGET_LOGGING_HPP
