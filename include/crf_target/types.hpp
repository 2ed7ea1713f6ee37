/**
 * @file types.hpp
 * @brief Core data types and constants for CRF Target
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Enumerations for encoders, pool methods, modes, task states
 *
 *          - TimeSegment for sample windows
 *
 *          - ChunkDescriptor / ChunkPlan for chunked encoding
 *
 *          - ProgressSnapshot for live progress reporting
 *
 *          - EncodeProgress for encoder status lines
 */

#ifndef CRF_TARGET_TYPES_HPP
#define CRF_TARGET_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crf_target {

// **----- CONSTANTS -----**

/**
 * @brief Recognized media file extensions (lowercase, without dot).
 * @note Used by the Scan Reporter and by single-file input validation.
 */
inline const std::vector<std::string> &media_extensions() {
  static const std::vector<std::string> exts = {
      "mkv", "avi", "mp4", "divx", "flv", "m4v",
      "mov", "ogv", "ts",  "webm", "wmv"};
  return exts;
}

// **----- ENUMERATIONS -----**

/// Supported encoders
enum class Encoder { Libx265, HevcNvenc, HevcQsv, Av1Qsv, LibSvtAv1, LibAomAv1 };

/// Per-frame score pooling method
enum class PoolMethod { Min, HarmonicMean, Mean };

/// Execution path for a task
enum class Mode { Default, Chunked };

/// Task lifecycle: Queued -> Running -> {Completed | Failed | Cancelled}
enum class TaskStatus { Queued, Running, Completed, Failed, Cancelled };

/// FFmpeg encoder name (the value passed to -c:v)
const char *to_string(Encoder e);
const char *to_string(PoolMethod p);
const char *to_string(Mode m);
const char *to_string(TaskStatus s);

/**
 * @brief Parse helpers.
 * @return true if the text names a known value, false otherwise
 */
bool parse_encoder(const std::string &text, Encoder &out);
bool parse_pool_method(const std::string &text, PoolMethod &out);
bool parse_mode(const std::string &text, Mode &out);

/// True once a task can no longer change state
inline bool is_terminal(TaskStatus s) {
  return s == TaskStatus::Completed || s == TaskStatus::Failed ||
         s == TaskStatus::Cancelled;
}

// **----- DATA STRUCTURES -----**

/**
 * @struct TimeSegment
 * @brief Represents a time range [start, end) in seconds.
 * @note Used for sample windows cut from a long source.
 */
struct TimeSegment {
  double start; //< Start time in seconds
  double end;   //< End time in seconds
};

/**
 * @struct ChunkDescriptor
 * @brief A contiguous time range [start, end) of the source, in seconds.
 */
struct ChunkDescriptor {
  double start; //< Start time in seconds
  double end;   //< End time in seconds
  int index;    //< Sequence index (concatenation order)

  double duration() const { return end - start; }
};

/**
 * @struct ChunkPlan
 * @brief Ordered, contiguous, non-overlapping chunks covering the source.
 */
struct ChunkPlan {
  std::vector<ChunkDescriptor> chunks;
  double source_duration = 0.0;   //< Total duration covered
  bool from_scene_detection = false; //< false = fixed-duration fallback
};

/**
 * @struct EncodeProgress
 * @brief One parsed encoder status line.
 */
struct EncodeProgress {
  uint64_t frame = 0;  //< Frames written so far
  double fps = 0.0;    //< Instantaneous encode speed
  uint64_t bytes = 0;  //< Output bytes written so far
};

/**
 * @struct ProgressSnapshot
 * @brief Live progress of one task.
 * @note Replaced wholesale on each update; never mutated in place by readers.
 */
struct ProgressSnapshot {
  std::string task_id;
  double fps = 0.0;
  uint64_t current_frame = 0;
  uint64_t total_frames = 0;       //< 0 when unknown
  double percentage = 0.0;         //< 0..100
  uint64_t bytes_written = 0;
  uint64_t current_file_count = 0; //< Position in a folder batch (1-based)
  uint64_t total_files = 0;        //< Size of the folder batch
  std::string current_file_name;   //< File or phase being worked on
  std::string eta;                 //< HH:MM:SS, empty when unknown
  double elapsed_sec = 0.0;
};

} // namespace crf_target

#endif // CRF_TARGET_TYPES_HPP
