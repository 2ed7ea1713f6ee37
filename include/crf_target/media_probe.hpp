/**
 * @file media_probe.hpp
 * @brief Container inspection: duration, frame rate, frame count
 *
 * @details Task setup needs the source duration (sampling decision, chunk
 *          planning, fallback chunking) and the frame count (progress
 *          percentage and ETA). MediaProbe is the seam; LibavMediaProbe
 *          reads the container header with libavformat.
 */

#ifndef CRF_TARGET_MEDIA_PROBE_HPP
#define CRF_TARGET_MEDIA_PROBE_HPP

#include <cstdint>
#include <string>

#include "status.hpp"

namespace crf_target {

/**
 * @struct MediaInfo
 * @brief What the pipeline needs to know about a source file.
 */
struct MediaInfo {
  double duration = 0.0;     //< Seconds
  double fps = 0.0;          //< Average frame rate of the best video stream
  uint64_t frame_count = 0;  //< Container count, or duration * fps
  int width = 0;
  int height = 0;
  uint64_t file_size = 0;    //< Bytes on disk
  int audio_streams = 0;
  int subtitle_streams = 0;
  std::string video_codec;   //< Decoder name of the video stream
};

/**
 * @class MediaProbe
 * @brief Capability: inspect a media file without decoding it.
 */
class MediaProbe {
public:
  virtual ~MediaProbe() = default;

  /**
   * @brief Read container-level information.
   * @return Ok, or ProbeFailed when the file cannot be opened or carries no
   *         video stream
   */
  virtual Status probe(const std::string &path, MediaInfo &info) = 0;
};

/**
 * @class LibavMediaProbe
 * @brief MediaProbe backed by libavformat.
 */
class LibavMediaProbe : public MediaProbe {
public:
  Status probe(const std::string &path, MediaInfo &info) override;
};

} // namespace crf_target

#endif // CRF_TARGET_MEDIA_PROBE_HPP
