/**
 * @file system.hpp
 * @brief System utilities, CPU detection, temp paths and time formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Worker count derivation for chunked encoding
 *
 *          - Temp directory resolution
 *
 *          - Time and ETA formatting utilities
 *
 * @note For Docker containers, CPU discovery respects cgroup limits set by
 *       docker-compose or docker run --cpus flags.
 */

#ifndef CRF_TARGET_SYSTEM_HPP
#define CRF_TARGET_SYSTEM_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace crf_target {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Measurement threads actually used per run.
 * @return requested clamped to [1, detect_cpu_limit()]
 */
int effective_vmaf_threads(int requested);

/**
 * @brief Number of concurrent chunk jobs for one chunked task.
 *
 * @note configured == 0 means auto: available_cpus / vmaf_threads, at
 *       least 1. A configured value is capped at the CPU count.
 */
int calculate_chunk_workers(int configured, int vmaf_threads);

// **---- Paths ----**

/// TEMP_DIR if set, otherwise the system temp directory
std::string temp_root();

/**
 * @class ScopedTempFiles
 * @brief Owns a set of temporary files and deletes them on destruction.
 */
class ScopedTempFiles {
  std::vector<std::string> paths;
  std::mutex mutex;

public:
  ScopedTempFiles() = default;
  ScopedTempFiles(const ScopedTempFiles &) = delete;
  ScopedTempFiles &operator=(const ScopedTempFiles &) = delete;
  ~ScopedTempFiles();

  /// Register path and return it
  std::string add(const std::string &path);

  /// Delete every owned file
  void remove_all();
};

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Remaining time for an encode.
 * @return HH:MM:SS, or empty when fps or total is unknown
 */
std::string format_eta(double fps, uint64_t current_frame,
                       uint64_t total_frames);

} // namespace crf_target

#endif // CRF_TARGET_SYSTEM_HPP
