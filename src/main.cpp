/**
 * @file main.cpp
 * @brief Entry point for CRF Target application
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Single file mode: one task
 *
 *          - Folder mode: one task per media file found by the scanner,
 *            run MAX_CONCURRENT_TASKS at a time
 *
 * @note Every option comes from the environment (see config/crf_target.env).
 *       The exit code is the number of failed tasks.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "crf_target/config.hpp"
#include "crf_target/logging.hpp"
#include "crf_target/scheduler.hpp"
#include "crf_target/system.hpp"
#include "crf_target/task_runner.hpp"

using namespace crf_target;

namespace {

std::atomic<bool> interrupted{false};

void on_signal(int) { interrupted.store(true); }

/// Print one progress line per running task
void print_progress(const Scheduler &scheduler) {
  for (const auto &task : scheduler.list()) {
    if (task.status != TaskStatus::Running)
      continue;
    const ProgressSnapshot &p = task.progress;
    std::string batch =
        p.total_files > 0
            ? fmt::format("[{}/{}] ", p.current_file_count, p.total_files)
            : std::string();
    LOG_INFO("[Task {}] {}{} {:5.1f}% frame {}/{} @ {:.1f} fps, {:.1f} MiB, "
             "elapsed {}, ETA {}",
             p.task_id, batch, p.current_file_name, p.percentage,
             p.current_frame, p.total_frames, p.fps,
             p.bytes_written / (1024.0 * 1024.0), format_time(p.elapsed_sec),
             p.eta.empty() ? "--:--:--" : p.eta);
  }
}

/// Final table; returns the number of failed tasks
int print_summary(const Scheduler &scheduler, double wall_clock_sec) {
  auto tasks = scheduler.list();
  int completed = 0;
  int failed = 0;
  int cancelled = 0;
  for (const auto &t : tasks) {
    if (t.status == TaskStatus::Completed)
      completed++;
    else if (t.status == TaskStatus::Failed)
      failed++;
    else if (t.status == TaskStatus::Cancelled)
      cancelled++;
  }

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== ENCODING SUMMARY ==================\n");
  fmt::print("{:<25} {:>25}\n", "Total tasks:", tasks.size());
  fmt::print("{:<25} {:>25}\n", "Completed:", completed);
  fmt::print("{:<25} {:>25}\n", "Failed:", failed);
  fmt::print("{:<25} {:>25}\n", "Cancelled:", cancelled);
  fmt::print("{:<25} {:>25}\n", "Concurrent tasks:", scheduler.max_concurrent());
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");

  for (const auto &t : tasks) {
    if (t.status == TaskStatus::Completed && t.selected_quality >= 0) {
      fmt::print("  {} -> crf {} (vmaf {:.2f})\n", t.config.output_path,
                 t.selected_quality, t.selected_score);
    }
    for (const auto &w : t.warnings)
      fmt::print(fg(fmt::color::yellow), "  [{}] warning: {}\n", t.id, w);
  }

  if (failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &t : tasks) {
      if (t.status == TaskStatus::Failed)
        fmt::print(fg(fmt::color::red), "  - {}: {}\n", t.config.input_path,
                   t.error);
    }
  }
  std::fflush(stdout);
  return failed;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 3) {
    LOG_WARN("Usage: ./crf_target <input-file-or-folder> "
             "<output-file-or-folder>");
    return 1;
  }

  namespace fs = std::filesystem;
  std::string input_arg = argv[1];
  std::string output_arg = argv[2];

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  LibavMediaProbe probe;
  FfmpegEncodeRunner encoder(Config::ffmpeg_bin());
  FfmpegVmafProber prober(Config::ffmpeg_bin());
  FfmpegStreamCopier copier(Config::ffmpeg_bin());
  FfmpegSceneDetector detector(Config::ffmpeg_bin());
  TaskRunner runner(Capabilities{probe, encoder, prober, copier, detector});

  Scheduler scheduler(runner, Config::max_concurrent_tasks());
  TaskConfig base = make_task_config(input_arg, output_arg);

  auto start_time = std::chrono::steady_clock::now();

  std::error_code ec;
  if (fs::is_directory(input_arg, ec)) {
    // **---- FOLDER MODE ----**

    fs::create_directories(output_arg, ec);
    if (ec) {
      LOG_ERROR("Cannot create output directory {}: {}", output_arg,
                ec.message());
      return 1;
    }

    LOG_INFO("CRF Target - Folder Mode");
    LOG_INFO("Input directory: {}", input_arg);
    LOG_INFO("Output directory: {}", output_arg);
    LOG_INFO("Encoder: {}, mode: {}, target VMAF {} ({}), concurrent tasks: {}",
             to_string(base.encoder), to_string(base.mode), base.target,
             to_string(base.pool), scheduler.max_concurrent());

    std::vector<std::string> ids;
    Status st = scheduler.submit_folder(input_arg, output_arg, base, ids);
    if (!st.is_ok()) {
      LOG_ERROR("{}", st.describe());
      return 1;
    }
    if (ids.empty()) {
      LOG_WARN("No video files found in directory");
      return 0;
    }
    scheduler.start_all();

  } else {
    // **---- SINGLE FILE MODE ----**

    LOG_INFO("CRF Target - Single File Mode");
    LOG_INFO("Input: {}", input_arg);
    LOG_INFO("Output: {}", output_arg);

    std::string id;
    Status st = scheduler.enqueue("", base, &id);
    if (st.is_ok())
      st = scheduler.start(id);
    if (!st.is_ok()) {
      LOG_ERROR("{}", st.describe());
      return 1;
    }
  }

  // **---- PROGRESS LOOP ----**

  auto last_print = std::chrono::steady_clock::now();
  for (;;) {
    bool pending = false;
    for (const auto &t : scheduler.list()) {
      if (!is_terminal(t.status)) {
        pending = true;
        break;
      }
    }
    if (!pending)
      break;

    if (interrupted.load()) {
      LOG_WARN("Interrupted, cancelling running tasks");
      scheduler.shutdown();
      break;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    auto now = std::chrono::steady_clock::now();
    if (now - last_print >= std::chrono::seconds(5)) {
      print_progress(scheduler);
      last_print = now;
    }
  }

  double wall_clock_sec = std::chrono::duration<double>(
                              std::chrono::steady_clock::now() - start_time)
                              .count();
  int failed = print_summary(scheduler, wall_clock_sec);

  if (scheduler.list().size() == 1)
    TimingCollector::print_summary();

  return failed;
}
