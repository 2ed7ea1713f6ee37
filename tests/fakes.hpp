/**
 * @file fakes.hpp
 * @brief Test doubles for the external capabilities
 *
 * @details The fakes write small text files instead of media so tests can
 *          check which quality a file was encoded at and in which order
 *          files were concatenated:
 *
 *          - FakeEncodeRunner writes "q=<quality> start=<s> end=<e>"
 *
 *          - FakeQualityProber reads q back and returns score(q)
 *
 *          - FakeStreamCopier::concat writes the parts' contents in order
 */

#ifndef CRF_TARGET_TESTS_FAKES_HPP
#define CRF_TARGET_TESTS_FAKES_HPP

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "crf_target/encode_runner.hpp"
#include "crf_target/media_probe.hpp"
#include "crf_target/quality_prober.hpp"
#include "crf_target/scene_splitter.hpp"
#include "crf_target/stream_copier.hpp"
#include "crf_target/task.hpp"

namespace crf_target {
namespace testing_support {

namespace fs = std::filesystem;

inline std::string read_file(const std::string &path) {
  std::ifstream in(path);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

inline void write_file(const std::string &path, const std::string &text) {
  std::ofstream out(path, std::ios::trunc);
  out << text;
}

/// Files in dir whose name contains needle
inline std::vector<std::string> files_containing(const std::string &dir,
                                                 const std::string &needle) {
  std::vector<std::string> out;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::string name = it->path().filename().string();
    if (name.find(needle) != std::string::npos)
      out.push_back(name);
  }
  return out;
}

/**
 * @class TempDir
 * @brief Unique directory under the system temp dir, removed on destruction.
 */
class TempDir {
  fs::path root;

public:
  TempDir() {
    std::random_device rd;
    root = fs::temp_directory_path() /
           fmt::format("crf_target_test_{:08x}", rd());
    fs::create_directories(root);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  std::string path() const { return root.string(); }
  std::string file(const std::string &name) const {
    return (root / name).string();
  }
};

// **---- FakeEncodeRunner ----**

class FakeEncodeRunner : public EncodeRunner {
public:
  /// Milliseconds to "encode" a request (interruptible)
  std::function<int(const EncodeRequest &)> delay_for;
  /// Return true to fail the request with EncodeFailed
  std::function<bool(const EncodeRequest &)> fail_if;
  double fps = 25.0;

  std::mutex mutex;
  std::vector<EncodeRequest> calls;
  std::atomic<int> cancelled{0};

  Status encode(const EncodeRequest &request,
                const EncodeProgressCallback &on_progress,
                const CancelTokenPtr &token) override {
    {
      std::lock_guard<std::mutex> lock(mutex);
      calls.push_back(request);
    }

    /// Partial output exists while "encoding"
    write_file(request.output_path, "partial");

    int delay = delay_for ? delay_for(request) : 0;
    if (delay > 0 && token &&
        token->wait_for(std::chrono::milliseconds(delay))) {
      std::remove(request.output_path.c_str());
      cancelled++;
      return Status(ErrorCode::Cancelled, "fake encode cancelled");
    }
    if (token && token->is_cancelled()) {
      std::remove(request.output_path.c_str());
      cancelled++;
      return Status(ErrorCode::Cancelled, "fake encode cancelled");
    }

    if (fail_if && fail_if(request)) {
      std::remove(request.output_path.c_str());
      return Status(ErrorCode::EncodeFailed, "fake encoder failure");
    }

    double length = request.end > request.start ? request.end - request.start
                                                : 4.0;
    uint64_t frames = static_cast<uint64_t>(length * fps);
    if (on_progress) {
      EncodeProgress p;
      p.frame = frames / 2;
      p.fps = fps;
      p.bytes = 1000;
      on_progress(p);
      p.frame = frames;
      p.bytes = 2000;
      on_progress(p);
    }

    write_file(request.output_path,
               fmt::format("q={} start={} end={}\n", request.quality,
                           request.start, request.end));
    return Status::ok();
  }

  size_t call_count() {
    std::lock_guard<std::mutex> lock(mutex);
    return calls.size();
  }
};

// **---- FakeQualityProber ----**

class FakeQualityProber : public QualityProber {
public:
  /// Score for a quality value
  std::function<double(int)> score = [](int q) { return 100.0 - q; };
  /// Return true to fail with MeasurementFailed
  std::function<bool(int)> fail_if;

  std::atomic<int> measurements{0};

  Status measure(const MeasureRequest &request, const CancelTokenPtr &token,
                 double &out) override {
    if (token && token->is_cancelled())
      return Status(ErrorCode::Cancelled, "fake measure cancelled");

    std::string text = read_file(request.candidate_path);
    int q = -1;
    if (std::sscanf(text.c_str(), "q=%d", &q) != 1)
      return Status(ErrorCode::MeasurementFailed, "candidate unreadable");

    measurements++;
    if (fail_if && fail_if(q))
      return Status(ErrorCode::MeasurementFailed, "fake measure failure");
    out = score(q);
    return Status::ok();
  }
};

// **---- FakeStreamCopier ----**

class FakeStreamCopier : public StreamCopier {
public:
  bool fail_concat = false;

  std::mutex mutex;
  std::vector<std::string> concat_parts;
  std::vector<TimeSegment> extracted;
  int extract_calls = 0;

  Status extract_segments(const std::string &input,
                          const std::vector<TimeSegment> &segments,
                          const std::string &output,
                          const CancelTokenPtr &token) override {
    (void)input;
    if (token && token->is_cancelled())
      return Status(ErrorCode::Cancelled, "fake extract cancelled");
    std::lock_guard<std::mutex> lock(mutex);
    extract_calls++;
    extracted = segments;
    write_file(output, "sample");
    return Status::ok();
  }

  Status concat(const std::vector<std::string> &parts,
                const std::string &streams_source, const std::string &output,
                const CancelTokenPtr &token) override {
    (void)streams_source;
    if (token && token->is_cancelled())
      return Status(ErrorCode::Cancelled, "fake concat cancelled");
    if (fail_concat)
      return Status(ErrorCode::ProcessFailed, "fake concat failure");

    std::string joined;
    for (const auto &p : parts)
      joined += read_file(p);

    std::lock_guard<std::mutex> lock(mutex);
    concat_parts = parts;
    write_file(output, joined);
    return Status::ok();
  }
};

// **---- FakeSceneDetector ----**

class FakeSceneDetector : public SceneDetector {
public:
  std::vector<double> cuts;
  bool fail = false;

  Status detect(const std::string &input, double threshold,
                const CancelTokenPtr &token,
                std::vector<double> &out) override {
    (void)input;
    (void)threshold;
    if (token && token->is_cancelled())
      return Status(ErrorCode::Cancelled, "fake detect cancelled");
    if (fail)
      return Status(ErrorCode::SceneDetectionUnavailable, "no scene filter");
    out = cuts;
    return Status::ok();
  }
};

// **---- FakeMediaProbe ----**

class FakeMediaProbe : public MediaProbe {
public:
  MediaInfo info;
  bool fail = false;

  FakeMediaProbe() {
    info.duration = 12.0;
    info.fps = 25.0;
    info.frame_count = 300;
    info.width = 1920;
    info.height = 1080;
  }

  Status probe(const std::string &path, MediaInfo &out) override {
    if (fail)
      return Status(ErrorCode::ProbeFailed, "fake probe failure: " + path);
    out = info;
    return Status::ok();
  }
};

/// Task configuration for tests: every file goes to dir
inline TaskConfig test_config(const TempDir &dir, const std::string &name) {
  TaskConfig c;
  c.input_path = dir.file(name + ".mkv");
  c.output_path = dir.file(name + ".out.mkv");
  c.work_dir = dir.path();
  c.target = 97.0;
  c.max_crf = 28;
  c.vmaf_threads = 1;
  c.chunk_workers = 3;
  write_file(c.input_path, "source");
  return c;
}

} // namespace testing_support
} // namespace crf_target

#endif // CRF_TARGET_TESTS_FAKES_HPP
