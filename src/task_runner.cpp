/**
 * @file task_runner.cpp
 * @brief TaskExecutor implementation for default and chunked modes
 */

#include "crf_target/task_runner.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "crf_target/logging.hpp"
#include "crf_target/system.hpp"

namespace crf_target {

namespace {

double percent(uint64_t current, uint64_t total) {
  if (total == 0)
    return 0.0;
  double p = 100.0 * static_cast<double>(current) / static_cast<double>(total);
  return p > 100.0 ? 100.0 : p;
}

ProgressSnapshot base_snapshot(const std::string &task_id,
                               const TaskConfig &config,
                               const MediaInfo &info) {
  ProgressSnapshot s;
  s.task_id = task_id;
  s.total_frames = info.frame_count;
  s.current_file_name =
      std::filesystem::path(config.input_path).filename().string();
  return s;
}

} // anonymous namespace

TaskRunner::TaskRunner(const Capabilities &capabilities)
    : caps(capabilities),
      search(capabilities.encoder, capabilities.prober, capabilities.copier),
      pipeline(search, capabilities.encoder, capabilities.copier) {}

Status TaskRunner::execute(const std::string &task_id,
                           const TaskConfig &config, TaskReporter &reporter,
                           const CancelTokenPtr &token) {
  Status st = validate(config);
  if (!st.is_ok())
    return st;

  TaskConfig effective = config;
  if (effective.work_dir.empty())
    effective.work_dir = temp_root();

  std::error_code ec;
  std::filesystem::create_directories(effective.work_dir, ec);
  if (ec) {
    return Status(ErrorCode::IoError,
                  fmt::format("cannot create {}: {}", effective.work_dir,
                              ec.message()));
  }
  auto out_dir = std::filesystem::path(effective.output_path).parent_path();
  if (!out_dir.empty()) {
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
      return Status(ErrorCode::IoError,
                    fmt::format("cannot create {}: {}", out_dir.string(),
                                ec.message()));
    }
  }

  MediaInfo info;
  st = caps.probe.probe(effective.input_path, info);
  if (!st.is_ok())
    return st;

  LOG_PHASE("[Task {}] {} ({:.1f}s, {} frames) -> {} [{} / {}]", task_id,
            effective.input_path, info.duration, info.frame_count,
            effective.output_path, to_string(effective.encoder),
            to_string(effective.mode));

  reporter.progress(base_snapshot(task_id, effective, info));

  if (effective.mode == Mode::Chunked)
    return run_chunked(task_id, effective, info, reporter, token);
  return run_default(task_id, effective, info, reporter, token);
}

Status TaskRunner::run_default(const std::string &task_id,
                               const TaskConfig &config, const MediaInfo &info,
                               TaskReporter &reporter,
                               const CancelTokenPtr &token) {
  const std::string log_prefix = fmt::format("[Task {}]", task_id);
  int quality = config.fixed_crf;

  // **---- SEARCH ----**

  if (quality < 0) {
    SearchRequest req;
    req.input_path = config.input_path;
    req.duration = info.duration;
    req.encoder = config.encoder;
    req.preset = config.preset;
    req.extra_params = config.extra_params;
    req.pix_fmt = config.pix_fmt;
    req.target = config.target;
    req.min_bound = config.min_crf;
    req.max_bound = config.max_crf;
    req.max_iterations = config.max_iterations;
    req.tolerance = config.tolerance;
    req.pool = config.pool;
    req.threads = config.vmaf_threads;
    req.subsample = config.vmaf_subsample;
    req.allow_sampling = true;
    req.sample_threshold = config.sample_threshold;
    req.sample_every = config.sample_every;
    req.sample_duration = config.sample_duration;
    req.work_dir = config.work_dir;
    req.file_prefix = task_id;
    req.log_prefix = log_prefix;

    LOG_INFO("{} Searching for best CRF for VMAF {}...", log_prefix,
             config.target);

    SearchCallbacks callbacks;
    callbacks.on_encode = [&](const EncodeProgress &p) {
      ProgressSnapshot s = base_snapshot(task_id, config, info);
      s.fps = p.fps;
      reporter.progress(s);
    };

    SearchResult found;
    Status st = search.search(req, token, found, callbacks);
    if (st.code == ErrorCode::TargetUnreachable) {
      LOG_WARN("{} {}", log_prefix, st.message);
      reporter.warning(st);
    } else if (!st.is_ok()) {
      return st;
    }
    quality = found.quality;
    reporter.selected(found.quality, found.score);
  } else {
    reporter.selected(quality, 0.0);
  }

  // **---- FINAL ENCODE ----**

  EncodeRequest enc;
  enc.input_path = config.input_path;
  enc.output_path = config.output_path;
  enc.encoder = config.encoder;
  enc.quality = quality;
  enc.preset = config.preset;
  enc.extra_params = config.extra_params;
  enc.pix_fmt = config.pix_fmt;
  enc.copy_other_streams = true;

  LOG_INFO("{} Encoding at crf {}", log_prefix, quality);

  TIMER_START(final_encode);
  Status st = caps.encoder.encode(
      enc,
      [&](const EncodeProgress &p) {
        ProgressSnapshot s = base_snapshot(task_id, config, info);
        s.fps = p.fps;
        s.current_frame = p.frame;
        s.bytes_written = p.bytes;
        s.percentage = percent(p.frame, info.frame_count);
        reporter.progress(s);
      },
      token);
  if (!st.is_ok())
    return st;
  TIMER_END(final_encode, fmt::format("{} final encode", log_prefix));

  ProgressSnapshot s = base_snapshot(task_id, config, info);
  s.current_frame = info.frame_count;
  s.percentage = 100.0;
  std::error_code ec;
  auto size = std::filesystem::file_size(config.output_path, ec);
  if (!ec)
    s.bytes_written = static_cast<uint64_t>(size);
  reporter.progress(s);
  return Status::ok();
}

Status TaskRunner::run_chunked(const std::string &task_id,
                               const TaskConfig &config, const MediaInfo &info,
                               TaskReporter &reporter,
                               const CancelTokenPtr &token) {
  SceneSplitter splitter(caps.probe, caps.detector, config.scene_threshold);

  ChunkPlan plan;
  Status st = splitter.plan(config.input_path, config.scene_split_min, token,
                            plan);
  if (st.code == ErrorCode::SceneDetectionUnavailable) {
    LOG_WARN("[Task {}] {}", task_id, st.message);
    reporter.warning(st);
  } else if (!st.is_ok()) {
    return st;
  }

  PipelineResult result;
  st = pipeline.run(task_id, config, plan, token, result,
                    [&](const PipelineProgress &p) {
                      ProgressSnapshot s = base_snapshot(task_id, config, info);
                      s.fps = p.fps;
                      s.current_frame = p.frames;
                      s.bytes_written = p.bytes;
                      s.percentage = percent(p.frames, info.frame_count);
                      reporter.progress(s);
                    });
  if (!st.is_ok())
    return st;

  for (const auto &w : result.warnings)
    reporter.warning(w);

  ProgressSnapshot s = base_snapshot(task_id, config, info);
  s.current_frame = result.frames;
  s.percentage = 100.0;
  std::error_code ec;
  auto size = std::filesystem::file_size(config.output_path, ec);
  if (!ec)
    s.bytes_written = static_cast<uint64_t>(size);
  reporter.progress(s);

  LOG_SUCCESS("[Task {}] Wrote {} from {} chunks", task_id,
              config.output_path, result.chunks.size());
  return Status::ok();
}

} // namespace crf_target
