/**
 * @file encode_runner.cpp
 * @brief FFmpeg encode runner implementation
 */

#include "crf_target/encode_runner.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "crf_target/logging.hpp"
#include "crf_target/process.hpp"

namespace crf_target {

namespace {

/// Position just after "key=" and any padding, npos if key is absent
size_t find_value(const std::string &line, const char *key) {
  size_t pos = line.find(key);
  if (pos == std::string::npos)
    return pos;
  pos += std::char_traits<char>::length(key);
  while (pos < line.size() && line[pos] == ' ')
    ++pos;
  return pos;
}

/// Scale for an ffmpeg size suffix
double size_multiplier(const char *suffix) {
  switch (suffix[0]) {
  case 'k':
  case 'K':
    return 1024.0;
  case 'M':
    return 1024.0 * 1024.0;
  case 'G':
    return 1024.0 * 1024.0 * 1024.0;
  default:
    return 1.0;
  }
}

void remove_output(const std::string &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec)
    LOG_WARN("Could not remove partial output {}: {}", path, ec.message());
}

} // anonymous namespace

std::vector<std::string> quality_args(Encoder encoder, int q) {
  std::string v = std::to_string(q);
  switch (encoder) {
  case Encoder::HevcNvenc:
    return {"-rc:v", "vbr", "-cq:v", v, "-qmin", v, "-qmax", v};
  case Encoder::HevcQsv:
  case Encoder::Av1Qsv:
    return {"-global_quality", v};
  case Encoder::LibAomAv1:
    return {"-crf", v, "-b:v", "0"};
  case Encoder::Libx265:
  case Encoder::LibSvtAv1:
  default:
    return {"-crf", v};
  }
}

bool parse_progress_line(const std::string &line, EncodeProgress &out) {
  size_t pos = find_value(line, "frame=");
  if (pos == std::string::npos)
    return false;

  char *end = nullptr;
  unsigned long long frame = std::strtoull(line.c_str() + pos, &end, 10);
  if (end == line.c_str() + pos)
    return false;
  out.frame = frame;

  pos = find_value(line, "fps=");
  if (pos != std::string::npos)
    out.fps = std::strtod(line.c_str() + pos, nullptr);

  /// "size=" on older builds, "Lsize=" on the final line
  pos = find_value(line, "size=");
  if (pos != std::string::npos) {
    double value = std::strtod(line.c_str() + pos, &end);
    if (end != line.c_str() + pos)
      out.bytes = static_cast<uint64_t>(value * size_multiplier(end));
  }
  return true;
}

// **---- FfmpegEncodeRunner ----**

FfmpegEncodeRunner::FfmpegEncodeRunner(std::string ffmpeg)
    : ffmpeg_bin(std::move(ffmpeg)) {}

std::vector<std::string>
FfmpegEncodeRunner::build_args(const EncodeRequest &request) const {
  std::vector<std::string> args = {ffmpeg_bin, "-hide_banner", "-nostdin",
                                   "-y"};

  if (request.end > request.start) {
    args.insert(args.end(), {"-ss", fmt::format("{:.3f}", request.start), "-to",
                             fmt::format("{:.3f}", request.end)});
  }
  args.insert(args.end(), {"-i", request.input_path, "-map", "0:v:0"});

  if (request.copy_other_streams) {
    args.insert(args.end(), {"-map", "0:a?", "-map", "0:s?", "-c:a", "copy",
                             "-c:s", "copy", "-map_metadata", "0"});
  } else {
    args.insert(args.end(), {"-an", "-sn", "-dn", "-map_metadata", "-1"});
  }

  args.insert(args.end(), {"-c:v", to_string(request.encoder)});

  if (!request.preset.empty()) {
    /// libaom has no -preset; its speed knob is -cpu-used
    const char *flag =
        request.encoder == Encoder::LibAomAv1 ? "-cpu-used" : "-preset";
    args.insert(args.end(), {flag, request.preset});
  }

  for (auto &p : split_args(request.extra_params))
    args.push_back(std::move(p));

  for (auto &q : quality_args(request.encoder, request.quality))
    args.push_back(std::move(q));

  if (!request.pix_fmt.empty())
    args.insert(args.end(), {"-pix_fmt", request.pix_fmt});

  args.push_back(request.output_path);
  return args;
}

Status FfmpegEncodeRunner::encode(const EncodeRequest &request,
                                  const EncodeProgressCallback &on_progress,
                                  const CancelTokenPtr &token) {
  if (request.input_path.empty() || request.output_path.empty())
    return Status(ErrorCode::InvalidArgument, "encode needs input and output");

  EncodeProgress progress;
  LineCallback on_line;
  if (on_progress) {
    on_line = [&](const std::string &line) {
      if (parse_progress_line(line, progress))
        on_progress(progress);
    };
  }

  ProcessResult result;
  Status st = run_process(build_args(request), on_line, token, result);
  if (st.is_ok())
    return st;

  remove_output(request.output_path);
  if (st.is_cancelled())
    return st;
  return Status(ErrorCode::EncodeFailed,
                fmt::format("{} at q={}: {}", to_string(request.encoder),
                            request.quality, st.message));
}

} // namespace crf_target
