/**
 * @file chunk_pipeline.hpp
 * @brief Concurrent per-chunk encoding and lossless reassembly
 *
 * @details PIPELINE ARCHITECTURE:
 *
 *          ┌──────────────────┐
 *          │ ChunkPlan        │  one job per chunk
 *          └────────┬─────────┘
 *                   ▼
 *          ┌──────────────────┐
 *          │ ChunkQueue       │  N workers pull jobs
 *          └────────┬─────────┘
 *                   ▼
 *          ┌──────────────────┐
 *          │ search + encode  │  per chunk, any completion order
 *          └────────┬─────────┘
 *                   ▼
 *          ┌──────────────────┐
 *          │ concat by index  │  stream copy, source audio/subs remuxed
 *          └──────────────────┘
 *
 *          If any chunk fails, every other in-flight chunk is cancelled,
 *          every chunk file is deleted and no final artifact is written.
 */

#ifndef CRF_TARGET_CHUNK_PIPELINE_HPP
#define CRF_TARGET_CHUNK_PIPELINE_HPP

#include <functional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "chunk_queue.hpp"
#include "crf_search.hpp"
#include "encode_runner.hpp"
#include "status.hpp"
#include "stream_copier.hpp"
#include "task.hpp"
#include "types.hpp"

namespace crf_target {

/**
 * @struct PipelineProgress
 * @brief Aggregate progress across all chunks of a task.
 */
struct PipelineProgress {
  uint64_t frames = 0; //< Frames written by finished + running chunk encodes
  double fps = 0.0;    //< Sum over running chunk encodes
  uint64_t bytes = 0;
  int chunks_done = 0;
  int chunks_total = 0;
};

/**
 * @struct PipelineResult
 * @brief What a successful pipeline run produced.
 */
struct PipelineResult {
  std::vector<ChunkOutcome> chunks;  //< Sorted by index
  std::vector<Status> warnings;      //< Per-chunk TargetUnreachable
  uint64_t frames = 0;
};

/**
 * @class ChunkPipeline
 * @brief Runs a ChunkPlan and concatenates the results.
 */
class ChunkPipeline {
  CrfSearchEngine &search;
  EncodeRunner &encoder;
  StreamCopier &copier;

public:
  using ProgressCallback = std::function<void(const PipelineProgress &)>;

  ChunkPipeline(CrfSearchEngine &search_engine, EncodeRunner &encode_runner,
                StreamCopier &stream_copier);

  /**
   * @brief Encode every chunk and write config.output_path.
   *
   * @param task_id Namespaces chunk files and log lines
   * @param token Task token; the pipeline derives a child for its workers
   * @return Ok, Cancelled, PartialChunkFailure (with the first chunk error),
   *         InvalidArgument for an empty plan or a repeated chunk index, or the
   *         concat error
   */
  Status run(const std::string &task_id, const TaskConfig &config,
             const ChunkPlan &plan, const CancelTokenPtr &token,
             PipelineResult &result,
             const ProgressCallback &on_progress = ProgressCallback());
};

} // namespace crf_target

#endif // CRF_TARGET_CHUNK_PIPELINE_HPP
