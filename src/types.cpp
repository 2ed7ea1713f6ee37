/**
 * @file types.cpp
 * @brief Enum name tables and Status formatting
 */

#include "crf_target/status.hpp"
#include "crf_target/types.hpp"

#include <fmt/core.h>

namespace crf_target {

// **---- Enum names ----**

const char *to_string(Encoder e) {
  switch (e) {
  case Encoder::Libx265:
    return "libx265";
  case Encoder::HevcNvenc:
    return "hevc_nvenc";
  case Encoder::HevcQsv:
    return "hevc_qsv";
  case Encoder::Av1Qsv:
    return "av1_qsv";
  case Encoder::LibSvtAv1:
    return "libsvtav1";
  case Encoder::LibAomAv1:
    return "libaom-av1";
  }
  return "libx265";
}

const char *to_string(PoolMethod p) {
  switch (p) {
  case PoolMethod::Min:
    return "min";
  case PoolMethod::HarmonicMean:
    return "harmonic_mean";
  case PoolMethod::Mean:
    return "mean";
  }
  return "mean";
}

const char *to_string(Mode m) {
  return m == Mode::Chunked ? "chunked" : "default";
}

const char *to_string(TaskStatus s) {
  switch (s) {
  case TaskStatus::Queued:
    return "queued";
  case TaskStatus::Running:
    return "running";
  case TaskStatus::Completed:
    return "completed";
  case TaskStatus::Failed:
    return "failed";
  case TaskStatus::Cancelled:
    return "cancelled";
  }
  return "queued";
}

const char *to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "OK";
  case ErrorCode::InvalidArgument:
    return "INVALID_ARGUMENT";
  case ErrorCode::DuplicateTask:
    return "DUPLICATE_TASK";
  case ErrorCode::NotFound:
    return "NOT_FOUND";
  case ErrorCode::InvalidState:
    return "INVALID_STATE";
  case ErrorCode::ProcessFailed:
    return "PROCESS_FAILED";
  case ErrorCode::MeasurementFailed:
    return "MEASUREMENT_FAILED";
  case ErrorCode::EncodeFailed:
    return "ENCODE_FAILED";
  case ErrorCode::TargetUnreachable:
    return "TARGET_UNREACHABLE";
  case ErrorCode::SceneDetectionUnavailable:
    return "SCENE_DETECTION_UNAVAILABLE";
  case ErrorCode::PartialChunkFailure:
    return "PARTIAL_CHUNK_FAILURE";
  case ErrorCode::ProbeFailed:
    return "PROBE_FAILED";
  case ErrorCode::IoError:
    return "IO_ERROR";
  case ErrorCode::Cancelled:
    return "CANCELLED";
  }
  return "UNKNOWN";
}

std::string Status::describe() const {
  if (message.empty())
    return to_string(code);
  return fmt::format("{}: {}", to_string(code), message);
}

// **---- Parsing ----**

bool parse_encoder(const std::string &text, Encoder &out) {
  static const Encoder all[] = {Encoder::Libx265,   Encoder::HevcNvenc,
                                Encoder::HevcQsv,   Encoder::Av1Qsv,
                                Encoder::LibSvtAv1, Encoder::LibAomAv1};
  for (Encoder e : all) {
    if (text == to_string(e)) {
      out = e;
      return true;
    }
  }
  /// "av1" is accepted as shorthand for libaom-av1
  if (text == "av1") {
    out = Encoder::LibAomAv1;
    return true;
  }
  return false;
}

bool parse_pool_method(const std::string &text, PoolMethod &out) {
  if (text == "min") {
    out = PoolMethod::Min;
  } else if (text == "harmonic_mean") {
    out = PoolMethod::HarmonicMean;
  } else if (text == "mean") {
    out = PoolMethod::Mean;
  } else {
    return false;
  }
  return true;
}

bool parse_mode(const std::string &text, Mode &out) {
  if (text == "default") {
    out = Mode::Default;
  } else if (text == "chunked") {
    out = Mode::Chunked;
  } else {
    return false;
  }
  return true;
}

} // namespace crf_target
