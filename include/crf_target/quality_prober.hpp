/**
 * @file quality_prober.hpp
 * @brief Perceptual quality measurement of a candidate against a reference
 *
 * @details The measurement tool reports one score per sampled frame. The
 *          prober pools them into a single number:
 *
 *          - mean: arithmetic mean of all sampled frames
 *
 *          - min: worst single frame (pessimistic target)
 *
 *          - harmonic_mean: penalizes low outliers more than the mean
 *
 *          Failures are never retried here. MeasurementFailed propagates to
 *          the search, which treats it as fatal for the candidate.
 */

#ifndef CRF_TARGET_QUALITY_PROBER_HPP
#define CRF_TARGET_QUALITY_PROBER_HPP

#include <string>
#include <vector>

#include "cancellation.hpp"
#include "status.hpp"
#include "types.hpp"

namespace crf_target {

/**
 * @struct MeasureRequest
 * @brief One reference/candidate comparison.
 * @note When reference_end > reference_start only that window of the
 *       reference is compared (chunk measurement against the full source).
 */
struct MeasureRequest {
  std::string reference_path;
  std::string candidate_path;
  double reference_start = 0.0;
  double reference_end = 0.0;
  PoolMethod pool = PoolMethod::Mean;
  int threads = 1;   //< >= 1
  int subsample = 1; //< >= 1, 1 = every frame
};

/**
 * @class QualityProber
 * @brief Capability: produce a pooled quality score for a candidate.
 */
class QualityProber {
public:
  virtual ~QualityProber() = default;

  /**
   * @brief Measure candidate against reference.
   * @param score Output: pooled score, valid only when Ok is returned
   * @return Ok, InvalidArgument, MeasurementFailed or Cancelled
   */
  virtual Status measure(const MeasureRequest &request,
                         const CancelTokenPtr &token, double &score) = 0;
};

/**
 * @class FfmpegVmafProber
 * @brief QualityProber running FFmpeg's libvmaf filter with a CSV frame log.
 */
class FfmpegVmafProber : public QualityProber {
  std::string ffmpeg_bin;

public:
  explicit FfmpegVmafProber(std::string ffmpeg = "ffmpeg");

  Status measure(const MeasureRequest &request, const CancelTokenPtr &token,
                 double &score) override;

  /// Command line for one measurement writing per-frame scores to csv_path
  std::vector<std::string> build_args(const MeasureRequest &request,
                                      const std::string &csv_path) const;
};

// **---- Pooling & parsing ----**

/**
 * @brief Pool per-frame scores.
 * @note harmonic_mean follows the libvmaf convention
 *       n / sum(1 / (s + 1)) - 1 so zero-score frames stay finite.
 * @return false when scores is empty
 */
bool pool_scores(const std::vector<double> &scores, PoolMethod method,
                 double &out);

/**
 * @brief Extract the "vmaf" column of a libvmaf CSV frame log.
 * @return Ok, or MeasurementFailed when the header or every row is unusable
 */
Status parse_vmaf_csv(const std::string &text, std::vector<double> &scores);

} // namespace crf_target

#endif // CRF_TARGET_QUALITY_PROBER_HPP
