/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides:
 *          - Global log mutex and the line writer behind the LOG_* macros
 *
 *          - TimingCollector static members and methods
 */

#include "crf_target/logging.hpp"

#include <chrono>
#include <cstdio>

#include <fmt/color.h>
#include <fmt/core.h>

namespace crf_target {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

namespace {

const auto process_start = std::chrono::steady_clock::now();

struct LevelStyle {
  const char *tag;
  fmt::text_style style;
};

LevelStyle style_for(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return {"[DEBUG] ", fg(fmt::color::gray)};
  case LogLevel::Warn:
    return {"[WARN] ", fg(fmt::color::yellow)};
  case LogLevel::Error:
    return {"[ERROR] ", fg(fmt::color::red)};
  case LogLevel::Phase:
    return {"", fg(fmt::color::cyan)};
  case LogLevel::Success:
    return {"", fg(fmt::color::green)};
  case LogLevel::Info:
  default:
    return {"[INFO] ", fmt::text_style()};
  }
}

} // anonymous namespace

void log_line(LogLevel level, const std::string &text) {
  double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - process_start)
                       .count();
  LevelStyle ls = style_for(level);

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("{:>9.3f} ", elapsed);
  fmt::print(ls.style, "{}{}\n", ls.tag, text);
  std::fflush(stdout);
}

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::vector<TimingEntry> copy = snapshot();
  if (copy.empty())
    return;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<36} {:>14}\n", "Stage", "Time [sec]");
  fmt::print("{:-<36} {:-<14}\n", "", "");

  long total_us = 0;
  for (const auto &e : copy) {
    fmt::print("{:<36} {:>13.2f}s\n", e.name, e.microseconds / 1000000.0);
    total_us += e.microseconds;
  }
  fmt::print("{:-<36} {:-<14}\n", "", "");
  fmt::print("{:<36} {:>13.2f}s\n", "Sum of stages", total_us / 1000000.0);
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

std::vector<TimingEntry> TimingCollector::snapshot() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries;
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace crf_target
