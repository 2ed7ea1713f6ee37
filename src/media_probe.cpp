/**
 * @file media_probe.cpp
 * @brief libavformat-backed media probe implementation
 */

#include "crf_target/media_probe.hpp"

#include <cmath>
#include <filesystem>
#include <system_error>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include <fmt/core.h>

#include "crf_target/logging.hpp"

namespace crf_target {

namespace {

/// Closes the format context on every return path
struct FormatContextGuard {
  AVFormatContext *ctx = nullptr;
  ~FormatContextGuard() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

} // anonymous namespace

Status LibavMediaProbe::probe(const std::string &path, MediaInfo &info) {
  info = MediaInfo();

  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return Status(ErrorCode::ProbeFailed,
                  fmt::format("cannot stat {}: {}", path, ec.message()));
  }
  info.file_size = static_cast<uint64_t>(size);

  FormatContextGuard guard;
  if (avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr) < 0) {
    return Status(ErrorCode::ProbeFailed,
                  fmt::format("avformat_open_input failed for {}", path));
  }

  /// Find stream info (reads some packets to determine streams)
  if (avformat_find_stream_info(guard.ctx, nullptr) < 0) {
    return Status(ErrorCode::ProbeFailed,
                  fmt::format("avformat_find_stream_info failed for {}", path));
  }

  int video_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    return Status(ErrorCode::ProbeFailed,
                  fmt::format("no video stream in {}", path));
  }

  for (unsigned int i = 0; i < guard.ctx->nb_streams; i++) {
    AVMediaType type = guard.ctx->streams[i]->codecpar->codec_type;
    if (type == AVMEDIA_TYPE_AUDIO)
      info.audio_streams++;
    else if (type == AVMEDIA_TYPE_SUBTITLE)
      info.subtitle_streams++;
  }

  AVStream *stream = guard.ctx->streams[video_idx];
  info.width = stream->codecpar->width;
  info.height = stream->codecpar->height;
  info.video_codec = avcodec_get_name(stream->codecpar->codec_id);

  /// Container duration first, stream duration as fallback
  if (guard.ctx->duration != AV_NOPTS_VALUE) {
    info.duration = guard.ctx->duration / static_cast<double>(AV_TIME_BASE);
  } else if (stream->duration != AV_NOPTS_VALUE) {
    info.duration = stream->duration * av_q2d(stream->time_base);
  }

  AVRational r = stream->avg_frame_rate;
  if (r.den > 0 && r.num > 0) {
    info.fps = av_q2d(r);
  } else {
    r = stream->r_frame_rate;
    info.fps = (r.den > 0 && r.num > 0) ? av_q2d(r) : 0.0;
  }

  /// Many containers (mkv, webm) carry no frame count
  if (stream->nb_frames > 0) {
    info.frame_count = static_cast<uint64_t>(stream->nb_frames);
  } else if (info.duration > 0.0 && info.fps > 0.0) {
    info.frame_count =
        static_cast<uint64_t>(std::llround(info.duration * info.fps));
  }

  LOG_DEBUG("probe {}: {:.2f}s @ {:.3f} fps, {} frames, {}x{} {}", path,
            info.duration, info.fps, info.frame_count, info.width,
            info.height, info.video_codec);
  return Status::ok();
}

} // namespace crf_target
