/**
 * @file quality_prober.cpp
 * @brief libvmaf-based quality prober implementation
 */

#include "crf_target/quality_prober.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include <fmt/core.h>

#include "crf_target/logging.hpp"
#include "crf_target/process.hpp"

namespace crf_target {

namespace {

/// Escape a path for use as a filtergraph option value
std::string escape_filter_value(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == ':' || c == '\\' || c == '\'' || c == ',' || c == ';' ||
        c == '[' || c == ']')
      out += '\\';
    out += c;
  }
  return out;
}

std::vector<std::string> split_csv_line(const std::string &line) {
  std::vector<std::string> fields;
  std::string field;
  std::istringstream in(line);
  while (std::getline(in, field, ','))
    fields.push_back(field);
  return fields;
}

} // anonymous namespace

// **---- Pooling & parsing ----**

bool pool_scores(const std::vector<double> &scores, PoolMethod method,
                 double &out) {
  if (scores.empty())
    return false;

  switch (method) {
  case PoolMethod::Min:
    out = *std::min_element(scores.begin(), scores.end());
    return true;
  case PoolMethod::HarmonicMean: {
    double inv_sum = 0.0;
    for (double s : scores)
      inv_sum += 1.0 / (s + 1.0);
    out = static_cast<double>(scores.size()) / inv_sum - 1.0;
    return true;
  }
  case PoolMethod::Mean:
  default: {
    double sum = 0.0;
    for (double s : scores)
      sum += s;
    out = sum / static_cast<double>(scores.size());
    return true;
  }
  }
}

Status parse_vmaf_csv(const std::string &text, std::vector<double> &scores) {
  scores.clear();
  std::istringstream in(text);
  std::string line;

  if (!std::getline(in, line))
    return Status(ErrorCode::MeasurementFailed, "empty frame log");

  auto header = split_csv_line(line);
  auto it = std::find(header.begin(), header.end(), "vmaf");
  if (it == header.end())
    return Status(ErrorCode::MeasurementFailed, "frame log has no vmaf column");
  size_t column = static_cast<size_t>(it - header.begin());

  while (std::getline(in, line)) {
    if (line.empty())
      continue;
    auto fields = split_csv_line(line);
    if (fields.size() <= column)
      continue;
    char *end = nullptr;
    double value = std::strtod(fields[column].c_str(), &end);
    if (end == fields[column].c_str())
      continue;
    scores.push_back(value);
  }

  if (scores.empty())
    return Status(ErrorCode::MeasurementFailed, "frame log has no scores");
  return Status::ok();
}

// **---- FfmpegVmafProber ----**

FfmpegVmafProber::FfmpegVmafProber(std::string ffmpeg)
    : ffmpeg_bin(std::move(ffmpeg)) {}

std::vector<std::string>
FfmpegVmafProber::build_args(const MeasureRequest &request,
                             const std::string &csv_path) const {
  std::vector<std::string> args = {ffmpeg_bin, "-hide_banner", "-nostdin",
                                   "-y"};

  /// Candidate is input 0 (distorted), reference is input 1
  args.insert(args.end(), {"-i", request.candidate_path});
  if (request.reference_end > request.reference_start) {
    args.insert(args.end(),
                {"-ss", fmt::format("{:.3f}", request.reference_start), "-to",
                 fmt::format("{:.3f}", request.reference_end)});
  }
  args.insert(args.end(), {"-i", request.reference_path});

  std::string graph = fmt::format(
      "[0:v]setpts=PTS-STARTPTS[distorted];"
      "[1:v]setpts=PTS-STARTPTS[reference];"
      "[distorted][reference]libvmaf=log_fmt=csv:log_path={}:"
      "n_threads={}:n_subsample={}",
      escape_filter_value(csv_path), request.threads, request.subsample);

  args.insert(args.end(), {"-lavfi", graph, "-f", "null", "-"});
  return args;
}

Status FfmpegVmafProber::measure(const MeasureRequest &request,
                                 const CancelTokenPtr &token, double &score) {
  if (request.threads < 1 || request.subsample < 1) {
    return Status(ErrorCode::InvalidArgument,
                  fmt::format("threads ({}) and subsample ({}) must be >= 1",
                              request.threads, request.subsample));
  }

  std::string csv_path = request.candidate_path + ".vmaf.csv";
  auto args = build_args(request, csv_path);

  ProcessResult result;
  Status st = run_process(args, LineCallback(), token, result);

  /// Read the frame log before removing it; it is ours on every path
  std::string text;
  {
    std::ifstream in(csv_path);
    if (in) {
      std::ostringstream buf;
      buf << in.rdbuf();
      text = buf.str();
    }
  }
  std::remove(csv_path.c_str());

  if (st.is_cancelled())
    return st;
  if (!st.is_ok())
    return Status(ErrorCode::MeasurementFailed, st.message);

  std::vector<double> frames;
  Status parsed = parse_vmaf_csv(text, frames);
  if (!parsed.is_ok())
    return parsed;

  if (!pool_scores(frames, request.pool, score))
    return Status(ErrorCode::MeasurementFailed, "no frames measured");

  LOG_DEBUG("vmaf {} ({} frames, {}) = {:.3f}", request.candidate_path,
            frames.size(), to_string(request.pool), score);
  return Status::ok();
}

} // namespace crf_target
