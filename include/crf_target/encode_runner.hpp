/**
 * @file encode_runner.hpp
 * @brief Encoder invocation with streamed progress and cancellation
 *
 * @details One EncodeRequest produces one output file. Every encoder takes
 *          the same request; the quality parameter is mapped to the flags
 *          the encoder understands:
 *
 *          - libx265, libsvtav1: -crf q
 *
 *          - libaom-av1: -crf q -b:v 0 (constant quality mode)
 *
 *          - hevc_nvenc: -rc:v vbr -cq:v q -qmin q -qmax q
 *
 *          - hevc_qsv, av1_qsv: -global_quality q
 *
 *          A failed or cancelled encode never leaves its output behind.
 */

#ifndef CRF_TARGET_ENCODE_RUNNER_HPP
#define CRF_TARGET_ENCODE_RUNNER_HPP

#include <functional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "status.hpp"
#include "types.hpp"

namespace crf_target {

/**
 * @struct EncodeRequest
 * @brief Parameters for one encode.
 */
struct EncodeRequest {
  std::string input_path;
  std::string output_path;
  Encoder encoder = Encoder::Libx265;
  int quality = 0;          //< CRF / CQ / global_quality value
  std::string preset;       //< Opaque, passed through
  std::string extra_params; //< Opaque, whitespace separated
  std::string pix_fmt;
  double start = 0.0;       //< Window start (seconds)
  double end = 0.0;         //< Window end; <= start means whole input
  bool copy_other_streams = false; //< Map audio and subtitles as copies
};

/// Receives parsed encoder status lines
using EncodeProgressCallback = std::function<void(const EncodeProgress &)>;

/**
 * @class EncodeRunner
 * @brief Capability: encode an input into an output file.
 */
class EncodeRunner {
public:
  virtual ~EncodeRunner() = default;

  /**
   * @brief Run one encode to completion.
   * @return Ok, EncodeFailed or Cancelled. On anything but Ok the output
   *         file does not exist when the call returns.
   */
  virtual Status encode(const EncodeRequest &request,
                        const EncodeProgressCallback &on_progress,
                        const CancelTokenPtr &token) = 0;
};

/**
 * @class FfmpegEncodeRunner
 * @brief EncodeRunner driving the ffmpeg binary.
 */
class FfmpegEncodeRunner : public EncodeRunner {
  std::string ffmpeg_bin;

public:
  explicit FfmpegEncodeRunner(std::string ffmpeg = "ffmpeg");

  Status encode(const EncodeRequest &request,
                const EncodeProgressCallback &on_progress,
                const CancelTokenPtr &token) override;

  /// Full command line for a request
  std::vector<std::string> build_args(const EncodeRequest &request) const;
};

/// Encoder-specific quality flags for value q
std::vector<std::string> quality_args(Encoder encoder, int q);

/**
 * @brief Parse an ffmpeg status line ("frame=  120 fps= 30 ... size= 1024kB").
 * @return true if the line carried a frame counter
 */
bool parse_progress_line(const std::string &line, EncodeProgress &out);

} // namespace crf_target

#endif // CRF_TARGET_ENCODE_RUNNER_HPP
