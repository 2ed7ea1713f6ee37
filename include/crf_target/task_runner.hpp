/**
 * @file task_runner.hpp
 * @brief The production TaskExecutor
 *
 * @details Default mode: probe -> search (sampled for long inputs) ->
 *          full encode with audio and subtitles copied.
 *
 *          Chunked mode: probe -> scene plan -> ChunkPipeline.
 *
 *          FIXED_CRF skips the search in both modes.
 */

#ifndef CRF_TARGET_TASK_RUNNER_HPP
#define CRF_TARGET_TASK_RUNNER_HPP

#include <string>

#include "chunk_pipeline.hpp"
#include "crf_search.hpp"
#include "encode_runner.hpp"
#include "media_probe.hpp"
#include "quality_prober.hpp"
#include "scene_splitter.hpp"
#include "stream_copier.hpp"
#include "task.hpp"

namespace crf_target {

/**
 * @struct Capabilities
 * @brief The external tools a TaskRunner drives.
 * @note Non-owning; the referenced objects must outlive the runner.
 */
struct Capabilities {
  MediaProbe &probe;
  EncodeRunner &encoder;
  QualityProber &prober;
  StreamCopier &copier;
  SceneDetector &detector;
};

class TaskRunner : public TaskExecutor {
  Capabilities caps;
  CrfSearchEngine search;
  ChunkPipeline pipeline;

public:
  explicit TaskRunner(const Capabilities &capabilities);

  Status execute(const std::string &task_id, const TaskConfig &config,
                 TaskReporter &reporter, const CancelTokenPtr &token) override;

private:
  Status run_default(const std::string &task_id, const TaskConfig &config,
                     const MediaInfo &info, TaskReporter &reporter,
                     const CancelTokenPtr &token);

  Status run_chunked(const std::string &task_id, const TaskConfig &config,
                     const MediaInfo &info, TaskReporter &reporter,
                     const CancelTokenPtr &token);
};

} // namespace crf_target

#endif // CRF_TARGET_TASK_RUNNER_HPP
