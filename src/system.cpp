/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Chunk worker derivation
 *
 *          - Temp file ownership
 *
 *          - Time formatting utilities
 */

#include "crf_target/system.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>

#include <fmt/core.h>

#include "crf_target/config.hpp"

namespace crf_target {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Parse a decimal prefix; -1 if there is none
long parse_long(const std::string &text) {
  char *end = nullptr;
  long val = std::strtol(text.c_str(), &end, 10);
  return (end == text.c_str()) ? -1 : val;
}

/// Helper to count CPUs in a cpuset string like "0,2,4,6,8" or "0-3"
int count_cpuset_string(const std::string &line) {
  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find(',', pos);
    if (end == std::string::npos)
      end = line.size();
    std::string item = line.substr(pos, end - pos);

    size_t dash = item.find('-');
    if (dash == std::string::npos) {
      if (parse_long(item) >= 0)
        ++count;
    } else {
      long first = parse_long(item.substr(0, dash));
      long last = parse_long(item.substr(dash + 1));
      if (first >= 0 && last >= first)
        count += static_cast<int>(last - first + 1);
    }
    pos = end + 1;
  }
  return count;
}

/// Helper to count CPUs from cpuset file
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  int n = count_cpuset_string(line);
  return n > 0 ? n : -1;
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        long quota = parse_long(quota_str);
        long period = parse_long(period_str);
        if (quota > 0 && period > 0) {
          limit = static_cast<int>((quota + period - 1) / period);
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = std::thread::hardware_concurrency();
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

int effective_vmaf_threads(int requested) {
  return std::max(1, std::min(requested, detect_cpu_limit()));
}

int calculate_chunk_workers(int configured, int vmaf_threads) {
  int available = detect_cpu_limit();

  /// Auto-detect: one measurement run per vmaf_threads cores
  if (configured <= 0) {
    return std::max(1, available / std::max(1, vmaf_threads));
  }

  return std::max(1, std::min(configured, available));
}

// **---- Paths ----**

std::string temp_root() {
  std::string dir = Config::temp_dir();
  if (!dir.empty())
    return dir;

  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  return ec ? std::string("/tmp") : tmp.string();
}

ScopedTempFiles::~ScopedTempFiles() { remove_all(); }

std::string ScopedTempFiles::add(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex);
  paths.push_back(path);
  return path;
}

void ScopedTempFiles::remove_all() {
  std::vector<std::string> owned;
  {
    std::lock_guard<std::mutex> lock(mutex);
    owned.swap(paths);
  }
  for (const auto &p : owned) {
    std::error_code ec;
    std::filesystem::remove(p, ec);
  }
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_eta(double fps, uint64_t current_frame,
                       uint64_t total_frames) {
  if (fps <= 0.0 || total_frames == 0 || current_frame > total_frames)
    return "";
  return format_time(static_cast<double>(total_frames - current_frame) / fps);
}

} // namespace crf_target
