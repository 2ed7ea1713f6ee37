/**
 * @file stream_copier.hpp
 * @brief Lossless stream-level cutting and concatenation
 *
 * @details Two operations never re-encode:
 *
 *          - extract_segments: copy windows of a source into one file (the
 *            search sample for long inputs)
 *
 *          - concat: join chunk encodes in the given order and remux the
 *            source's audio and subtitle streams into the result
 *
 *          The FFmpeg implementation feeds the concat demuxer from an
 *          in-memory list (memfd) so no list file touches the disk.
 */

#ifndef CRF_TARGET_STREAM_COPIER_HPP
#define CRF_TARGET_STREAM_COPIER_HPP

#include <string>
#include <vector>

#include "cancellation.hpp"
#include "status.hpp"
#include "types.hpp"

namespace crf_target {

/**
 * @class StreamCopier
 * @brief Capability: cut and join media without re-encoding.
 */
class StreamCopier {
public:
  virtual ~StreamCopier() = default;

  /**
   * @brief Copy the video of each segment of input, in order, into output.
   * @return Ok, ProcessFailed, IoError or Cancelled; output is removed on
   *         failure
   */
  virtual Status extract_segments(const std::string &input,
                                  const std::vector<TimeSegment> &segments,
                                  const std::string &output,
                                  const CancelTokenPtr &token) = 0;

  /**
   * @brief Join parts in vector order into output.
   * @param streams_source File whose audio/subtitle streams are copied into
   *        output (empty = video only)
   * @return Ok, ProcessFailed, IoError or Cancelled; output is removed on
   *         failure
   */
  virtual Status concat(const std::vector<std::string> &parts,
                        const std::string &streams_source,
                        const std::string &output,
                        const CancelTokenPtr &token) = 0;
};

/**
 * @class FfmpegStreamCopier
 * @brief StreamCopier using the ffmpeg concat demuxer.
 */
class FfmpegStreamCopier : public StreamCopier {
  std::string ffmpeg_bin;

public:
  explicit FfmpegStreamCopier(std::string ffmpeg = "ffmpeg");

  Status extract_segments(const std::string &input,
                          const std::vector<TimeSegment> &segments,
                          const std::string &output,
                          const CancelTokenPtr &token) override;

  Status concat(const std::vector<std::string> &parts,
                const std::string &streams_source, const std::string &output,
                const CancelTokenPtr &token) override;
};

// **---- Helpers ----**

/**
 * @brief Concat demuxer list for a set of files.
 * @param segments Per-file inpoint/outpoint (empty = whole files)
 */
std::string build_concat_list(const std::vector<std::string> &files,
                              const std::vector<TimeSegment> &segments);

/**
 * @brief Evenly spaced sample windows over a source.
 *
 * @details One window of window_length per sample_every seconds of source,
 *          centred in its interval, at least one window. Windows never
 *          overlap and never run past duration.
 */
std::vector<TimeSegment> plan_sample_segments(double duration,
                                              double sample_every,
                                              double window_length);

} // namespace crf_target

#endif // CRF_TARGET_STREAM_COPIER_HPP
