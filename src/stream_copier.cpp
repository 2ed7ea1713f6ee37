/**
 * @file stream_copier.cpp
 * @brief FFmpeg concat-demuxer stream copier implementation
 */

#include "crf_target/stream_copier.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include <sys/syscall.h>
#include <unistd.h>

#include <fmt/core.h>

#include "crf_target/logging.hpp"
#include "crf_target/process.hpp"

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace crf_target {

namespace {

/**
 * @class MemoryFile
 * @brief Anonymous in-memory file holding a concat list.
 * @note The child ffmpeg opens it through /proc/<pid>/fd/<fd>.
 */
class MemoryFile {
  int fd = -1;

public:
  MemoryFile() = default;
  MemoryFile(const MemoryFile &) = delete;
  MemoryFile &operator=(const MemoryFile &) = delete;
  ~MemoryFile() {
    if (fd >= 0)
      close(fd);
  }

  Status create(const std::string &content) {
    fd = static_cast<int>(syscall(SYS_memfd_create, "concat_list_mem",
                                  MFD_CLOEXEC));
    if (fd == -1) {
      return Status(ErrorCode::IoError,
                    fmt::format("memfd_create failed: {}", std::strerror(errno)));
    }

    size_t written = 0;
    while (written < content.size()) {
      ssize_t n =
          write(fd, content.data() + written, content.size() - written);
      if (n < 0) {
        if (errno == EINTR)
          continue;
        return Status(ErrorCode::IoError,
                      fmt::format("write to memory file failed: {}",
                                  std::strerror(errno)));
      }
      written += static_cast<size_t>(n);
    }
    return Status::ok();
  }

  std::string path() const {
    return fmt::format("/proc/{}/fd/{}", getpid(), fd);
  }
};

/// Quote a path for the concat list ('\'' closes, escapes, reopens)
std::string quote_list_path(const std::string &path) {
  std::string out = "'";
  for (char c : path) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += "'";
  return out;
}

void remove_file(const std::string &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // anonymous namespace

// **---- Helpers ----**

std::string build_concat_list(const std::vector<std::string> &files,
                              const std::vector<TimeSegment> &segments) {
  std::string list_content;
  list_content.reserve(4096);

  for (size_t i = 0; i < files.size(); ++i) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(files[i], ec);
    std::string abs_path = ec ? files[i] : abs.string();
    list_content += fmt::format("file {}\n", quote_list_path(abs_path));
    if (i < segments.size()) {
      list_content += fmt::format("inpoint {:.3f}\n", segments[i].start);
      list_content += fmt::format("outpoint {:.3f}\n", segments[i].end);
    }
  }
  return list_content;
}

std::vector<TimeSegment> plan_sample_segments(double duration,
                                              double sample_every,
                                              double window_length) {
  std::vector<TimeSegment> segments;
  if (duration <= 0.0 || window_length <= 0.0)
    return segments;

  if (window_length >= duration) {
    segments.push_back({0.0, duration});
    return segments;
  }

  int count = sample_every > 0.0
                  ? std::max(1, static_cast<int>(duration / sample_every))
                  : 1;
  double interval = duration / count;
  double length = std::min(window_length, interval);

  for (int i = 0; i < count; ++i) {
    double centre = (i + 0.5) * interval;
    double start = std::max(0.0, centre - length / 2.0);
    double end = std::min(duration, start + length);
    segments.push_back({start, end});
  }
  return segments;
}

// **---- FfmpegStreamCopier ----**

FfmpegStreamCopier::FfmpegStreamCopier(std::string ffmpeg)
    : ffmpeg_bin(std::move(ffmpeg)) {}

Status FfmpegStreamCopier::extract_segments(
    const std::string &input, const std::vector<TimeSegment> &segments,
    const std::string &output, const CancelTokenPtr &token) {
  if (segments.empty())
    return Status(ErrorCode::InvalidArgument, "no segments to extract");

  std::vector<std::string> files;
  std::vector<TimeSegment> valid;
  for (const auto &s : segments) {
    if (s.end <= s.start)
      continue;
    files.push_back(input);
    valid.push_back(s);
  }

  MemoryFile list;
  Status st = list.create(build_concat_list(files, valid));
  if (!st.is_ok())
    return st;

  std::vector<std::string> args = {
      ffmpeg_bin, "-hide_banner", "-nostdin", "-y", "-loglevel", "error",
      "-f", "concat", "-safe", "0", "-protocol_whitelist", "file,pipe,fd",
      "-i", list.path(), "-map", "0:v:0", "-c", "copy", "-fflags", "+genpts",
      "-avoid_negative_ts", "make_zero", output};

  ProcessResult result;
  st = run_process(args, LineCallback(), token, result);
  if (!st.is_ok())
    remove_file(output);
  return st;
}

Status FfmpegStreamCopier::concat(const std::vector<std::string> &parts,
                                  const std::string &streams_source,
                                  const std::string &output,
                                  const CancelTokenPtr &token) {
  if (parts.empty())
    return Status(ErrorCode::InvalidArgument, "no parts to concatenate");

  MemoryFile list;
  Status st = list.create(build_concat_list(parts, {}));
  if (!st.is_ok())
    return st;

  std::vector<std::string> args = {
      ffmpeg_bin, "-hide_banner", "-nostdin", "-y", "-loglevel", "error",
      "-f", "concat", "-safe", "0", "-protocol_whitelist", "file,pipe,fd",
      "-i", list.path()};

  if (!streams_source.empty()) {
    args.insert(args.end(), {"-i", streams_source, "-map", "0:v", "-map",
                             "1:a?", "-map", "1:s?", "-map_metadata", "1"});
  } else {
    args.insert(args.end(), {"-map", "0:v"});
  }
  args.insert(args.end(), {"-c", "copy", output});

  ProcessResult result;
  st = run_process(args, LineCallback(), token, result);
  if (!st.is_ok())
    remove_file(output);
  return st;
}

} // namespace crf_target
