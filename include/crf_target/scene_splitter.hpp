/**
 * @file scene_splitter.hpp
 * @brief Chunk planning aligned to scene changes
 *
 * @details Cut timestamps from a SceneDetector are merged so every chunk is
 *          at least the configured minimum (the trailing chunk may be
 *          shorter). The plan always covers [0, duration) with contiguous,
 *          non-overlapping chunks in index order.
 *
 *          When no cut can be obtained the source is split at fixed
 *          min_chunk_duration boundaries and SceneDetectionUnavailable is
 *          returned alongside a usable plan.
 */

#ifndef CRF_TARGET_SCENE_SPLITTER_HPP
#define CRF_TARGET_SCENE_SPLITTER_HPP

#include <string>
#include <vector>

#include "cancellation.hpp"
#include "media_probe.hpp"
#include "status.hpp"
#include "types.hpp"

namespace crf_target {

/**
 * @class SceneDetector
 * @brief Capability: report scene-change timestamps of a source.
 */
class SceneDetector {
public:
  virtual ~SceneDetector() = default;

  /**
   * @param threshold Scene score above which a frame starts a new scene
   * @param cuts Output: timestamps in seconds, ascending
   */
  virtual Status detect(const std::string &input, double threshold,
                        const CancelTokenPtr &token,
                        std::vector<double> &cuts) = 0;
};

/**
 * @class FfmpegSceneDetector
 * @brief SceneDetector using select='gt(scene,T)',showinfo.
 */
class FfmpegSceneDetector : public SceneDetector {
  std::string ffmpeg_bin;

public:
  explicit FfmpegSceneDetector(std::string ffmpeg = "ffmpeg");

  Status detect(const std::string &input, double threshold,
                const CancelTokenPtr &token,
                std::vector<double> &cuts) override;
};

/// Parse "pts_time:<seconds>" out of a showinfo line
bool parse_pts_time(const std::string &line, double &seconds);

/**
 * @brief Merge cuts into a plan honouring the minimum chunk duration.
 * @note Cuts outside (0, duration) are ignored; order does not matter.
 */
ChunkPlan plan_chunks(std::vector<double> cuts, double duration,
                      double min_chunk_duration);

/// Fixed-duration plan: boundaries every min_chunk_duration seconds
ChunkPlan plan_fixed_chunks(double duration, double min_chunk_duration);

/**
 * @class SceneSplitter
 * @brief Produces the ChunkPlan for a chunked task.
 */
class SceneSplitter {
  MediaProbe &probe;
  SceneDetector &detector;
  double threshold;

public:
  SceneSplitter(MediaProbe &media_probe, SceneDetector &scene_detector,
                double scene_threshold);

  /**
   * @brief Plan chunks for input.
   * @return Ok (scene-aligned), SceneDetectionUnavailable (fixed fallback,
   *         plan valid), or ProbeFailed / InvalidArgument / Cancelled (no
   *         plan)
   */
  Status plan(const std::string &input_path, double min_chunk_duration,
              const CancelTokenPtr &token, ChunkPlan &out);
};

} // namespace crf_target

#endif // CRF_TARGET_SCENE_SPLITTER_HPP
