/**
 * @file scene_splitter.cpp
 * @brief Scene detection and chunk planning implementation
 */

#include "crf_target/scene_splitter.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>

#include <fmt/core.h>

#include "crf_target/logging.hpp"
#include "crf_target/process.hpp"

namespace crf_target {

namespace {

/// Chunks shorter than this are rounding noise, not content
constexpr double MIN_TRAILING_CHUNK = 1e-3;

ChunkPlan plan_from_boundaries(const std::vector<double> &boundaries,
                               double duration) {
  ChunkPlan plan;
  plan.source_duration = duration;
  for (size_t i = 0; i + 1 < boundaries.size(); ++i) {
    plan.chunks.push_back(
        {boundaries[i], boundaries[i + 1], static_cast<int>(i)});
  }
  return plan;
}

} // anonymous namespace

// **---- FfmpegSceneDetector ----**

FfmpegSceneDetector::FfmpegSceneDetector(std::string ffmpeg)
    : ffmpeg_bin(std::move(ffmpeg)) {}

bool parse_pts_time(const std::string &line, double &seconds) {
  size_t pos = line.find("pts_time:");
  if (pos == std::string::npos)
    return false;
  const char *begin = line.c_str() + pos + 9;
  char *end = nullptr;
  double value = std::strtod(begin, &end);
  if (end == begin)
    return false;
  seconds = value;
  return true;
}

Status FfmpegSceneDetector::detect(const std::string &input, double threshold,
                                   const CancelTokenPtr &token,
                                   std::vector<double> &cuts) {
  cuts.clear();
  std::vector<std::string> args = {
      ffmpeg_bin, "-hide_banner", "-nostdin", "-i", input, "-map", "0:v:0",
      "-vf", fmt::format("select='gt(scene,{})',showinfo", threshold), "-f",
      "null", "-"};

  auto on_line = [&cuts](const std::string &line) {
    double t = 0.0;
    if (line.find("Parsed_showinfo") != std::string::npos &&
        parse_pts_time(line, t))
      cuts.push_back(t);
  };

  ProcessResult result;
  Status st = run_process(args, on_line, token, result);
  if (st.is_cancelled())
    return st;
  if (!st.is_ok())
    return Status(ErrorCode::SceneDetectionUnavailable, st.message);
  return Status::ok();
}

// **---- Planning ----**

ChunkPlan plan_chunks(std::vector<double> cuts, double duration,
                      double min_chunk_duration) {
  std::sort(cuts.begin(), cuts.end());

  std::vector<double> boundaries = {0.0};
  for (double t : cuts) {
    if (t <= 0.0 || t >= duration)
      continue;
    /// Merge micro-scenes into the current chunk
    if (t - boundaries.back() < min_chunk_duration)
      continue;
    boundaries.push_back(t);
  }
  if (duration - boundaries.back() < MIN_TRAILING_CHUNK &&
      boundaries.size() > 1)
    boundaries.pop_back();
  boundaries.push_back(duration);

  ChunkPlan plan = plan_from_boundaries(boundaries, duration);
  plan.from_scene_detection = true;
  return plan;
}

ChunkPlan plan_fixed_chunks(double duration, double min_chunk_duration) {
  std::vector<double> boundaries = {0.0};
  if (min_chunk_duration > 0.0) {
    for (int k = 1;; ++k) {
      double t = k * min_chunk_duration;
      if (duration - t < MIN_TRAILING_CHUNK)
        break;
      boundaries.push_back(t);
    }
  }
  boundaries.push_back(duration);
  return plan_from_boundaries(boundaries, duration);
}

// **---- SceneSplitter ----**

SceneSplitter::SceneSplitter(MediaProbe &media_probe,
                             SceneDetector &scene_detector,
                             double scene_threshold)
    : probe(media_probe), detector(scene_detector),
      threshold(scene_threshold) {}

Status SceneSplitter::plan(const std::string &input_path,
                           double min_chunk_duration,
                           const CancelTokenPtr &token, ChunkPlan &out) {
  out = ChunkPlan();
  if (min_chunk_duration <= 0.0) {
    return Status(ErrorCode::InvalidArgument,
                  fmt::format("minimum chunk duration {} must be > 0",
                              min_chunk_duration));
  }

  MediaInfo info;
  Status st = probe.probe(input_path, info);
  if (!st.is_ok())
    return st;
  if (info.duration <= 0.0) {
    return Status(ErrorCode::ProbeFailed,
                  fmt::format("{} has no known duration", input_path));
  }

  TIMER_START(scenes);
  std::vector<double> cuts;
  st = detector.detect(input_path, threshold, token, cuts);
  if (st.is_cancelled())
    return st;

  if (st.is_ok() && !cuts.empty()) {
    out = plan_chunks(cuts, info.duration, min_chunk_duration);
    TIMER_END(scenes, fmt::format("scene detection {}", input_path));
    LOG_INFO("Detected {} scene cuts, planned {} chunks", cuts.size(),
             out.chunks.size());
    return Status::ok();
  }

  out = plan_fixed_chunks(info.duration, min_chunk_duration);
  std::string reason = st.is_ok() ? "no scene cuts reported" : st.message;
  return Status(ErrorCode::SceneDetectionUnavailable,
                fmt::format("{}; using {} fixed {:.1f}s chunks", reason,
                            out.chunks.size(), min_chunk_duration));
}

} // namespace crf_target
