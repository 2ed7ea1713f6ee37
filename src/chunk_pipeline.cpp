/**
 * @file chunk_pipeline.cpp
 * @brief Chunk pipeline implementation
 *
 * @details Worker threads pull ChunkDescriptors from a ChunkQueue. Each
 *          chunk is searched (or encoded at the fixed quality) and then
 *          encoded in full into <work_dir>/<task>_chunk<index>.mkv.
 *
 * @attention FAILURE HANDLING:
 *
 *          - first fatal chunk error is kept, the queue is cleared and the
 *            pipeline's child token is cancelled so in-flight encodes stop
 *
 *          - all chunk files are owned by one ScopedTempFiles and deleted
 *            when run() returns, on success and on failure
 */

#include "crf_target/chunk_pipeline.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

#include <fmt/core.h>

#include "crf_target/logging.hpp"
#include "crf_target/system.hpp"

namespace crf_target {

namespace {

/**
 * @class ProgressAggregator
 * @brief Per-chunk encode counters folded into one PipelineProgress.
 */
class ProgressAggregator {
  std::mutex mutex;
  std::vector<EncodeProgress> running;
  std::vector<bool> done;
  const ChunkPipeline::ProgressCallback &callback;

public:
  ProgressAggregator(size_t chunks,
                     const ChunkPipeline::ProgressCallback &cb)
      : running(chunks), done(chunks, false), callback(cb) {}

  /// slot is the chunk's position in the plan, not its index
  void update(size_t slot, const EncodeProgress &p) {
    publish([&] { running[slot] = p; });
  }

  void finish(size_t slot) {
    publish([&] {
      running[slot].fps = 0.0;
      done[slot] = true;
    });
  }

private:
  template <typename F> void publish(F &&mutate) {
    if (!callback)
      return;
    PipelineProgress agg;
    {
      std::lock_guard<std::mutex> lock(mutex);
      mutate();
      agg.chunks_total = static_cast<int>(running.size());
      for (size_t i = 0; i < running.size(); ++i) {
        agg.frames += running[i].frame;
        agg.bytes += running[i].bytes;
        agg.fps += running[i].fps;
        if (done[i])
          agg.chunks_done++;
      }
    }
    callback(agg);
  }
};

} // anonymous namespace

ChunkPipeline::ChunkPipeline(CrfSearchEngine &search_engine,
                             EncodeRunner &encode_runner,
                             StreamCopier &stream_copier)
    : search(search_engine), encoder(encode_runner), copier(stream_copier) {}

Status ChunkPipeline::run(const std::string &task_id, const TaskConfig &config,
                          const ChunkPlan &plan, const CancelTokenPtr &token,
                          PipelineResult &result,
                          const ProgressCallback &on_progress) {
  result = PipelineResult();
  if (plan.chunks.empty())
    return Status(ErrorCode::InvalidArgument, "chunk plan is empty");

  const size_t total = plan.chunks.size();
  std::map<int, size_t> slots;
  for (size_t i = 0; i < total; ++i) {
    if (!slots.emplace(plan.chunks[i].index, i).second)
      return Status(ErrorCode::InvalidArgument,
                    fmt::format("chunk index {} appears twice",
                                plan.chunks[i].index));
  }
  const int workers = std::max(
      1, std::min(config.chunk_workers, static_cast<int>(total)));

  LOG_PHASE("[Task {}] Encoding {} chunks with {} workers", task_id, total,
            workers);

  CancelTokenPtr pipeline_token =
      token ? token->make_child() : CancelToken::create();

  ScopedTempFiles chunk_files;
  ChunkQueue queue;
  ChunkResultCollector collector;
  collector.reserve(total);
  ProgressAggregator aggregator(total, on_progress);

  std::mutex error_mutex;
  Status first_error;
  int failed_index = -1;
  std::vector<Status> warnings;

  for (const auto &chunk : plan.chunks)
    queue.push(chunk);
  queue.finish();

  auto fail = [&](int index, const Status &st) {
    {
      std::lock_guard<std::mutex> lock(error_mutex);
      if (failed_index < 0) {
        failed_index = index;
        first_error = st;
      }
    }
    queue.clear();
    pipeline_token->cancel();
  };

  auto worker = [&]() {
    ChunkDescriptor chunk;
    while (queue.pop(chunk)) {
      if (pipeline_token->is_cancelled())
        break;

      std::string log_prefix =
          fmt::format("[Task {}][Chunk {}]", task_id, chunk.index);
      std::string prefix = fmt::format("{}_chunk{:04d}", task_id, chunk.index);
      std::string chunk_path = chunk_files.add(
          (std::filesystem::path(config.work_dir) / (prefix + ".mkv"))
              .string());

      ChunkOutcome outcome;
      outcome.index = chunk.index;
      outcome.output_path = chunk_path;

      // **---- QUALITY SELECTION ----**

      if (config.fixed_crf >= 0) {
        outcome.quality = config.fixed_crf;
      } else {
        SearchRequest req;
        req.input_path = config.input_path;
        req.start = chunk.start;
        req.end = chunk.end;
        req.duration = chunk.duration();
        req.encoder = config.encoder;
        req.preset = config.preset;
        req.extra_params = config.extra_params;
        req.pix_fmt = config.pix_fmt;
        req.target = config.target;
        req.min_bound = config.min_crf;
        req.max_bound = config.max_crf;
        req.max_iterations = config.max_iterations;
        req.tolerance = config.tolerance;
        req.pool = config.pool;
        req.threads = config.vmaf_threads;
        req.subsample = config.vmaf_subsample;
        req.allow_sampling = false;
        req.work_dir = config.work_dir;
        req.file_prefix = prefix;
        req.log_prefix = log_prefix;

        SearchResult found;
        Status st = search.search(req, pipeline_token, found);
        if (st.code == ErrorCode::TargetUnreachable) {
          LOG_WARN("{} {}", log_prefix, st.message);
          std::lock_guard<std::mutex> lock(error_mutex);
          warnings.push_back(Status(
              st.code, fmt::format("chunk {}: {}", chunk.index, st.message)));
        } else if (!st.is_ok()) {
          if (!st.is_cancelled())
            LOG_ERROR("{} Search failed: {}", log_prefix, st.describe());
          fail(chunk.index, st);
          break;
        }
        outcome.quality = found.quality;
        outcome.score = found.score;
        outcome.target_met = found.target_met;
      }

      // **---- CHUNK ENCODE ----**

      EncodeRequest enc;
      enc.input_path = config.input_path;
      enc.output_path = chunk_path;
      enc.encoder = config.encoder;
      enc.quality = outcome.quality;
      enc.preset = config.preset;
      enc.extra_params = config.extra_params;
      enc.pix_fmt = config.pix_fmt;
      enc.start = chunk.start;
      enc.end = chunk.end;

      const size_t slot = slots.at(chunk.index);
      auto on_encode = [&aggregator, slot, &outcome](const EncodeProgress &p) {
        outcome.frames = p.frame;
        aggregator.update(slot, p);
      };

      TIMER_START(chunk_encode);
      Status st = encoder.encode(enc, on_encode, pipeline_token);
      if (!st.is_ok()) {
        if (!st.is_cancelled())
          LOG_ERROR("{} Encode failed: {}", log_prefix, st.describe());
        fail(chunk.index, st);
        break;
      }
      TIMER_END(chunk_encode, fmt::format("{} encode", log_prefix));

      aggregator.finish(slot);
      LOG_INFO("{} Done at crf {} ({:.2f}s - {:.2f}s)", log_prefix,
               outcome.quality, chunk.start, chunk.end);
      collector.add(std::move(outcome));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (int i = 0; i < workers; ++i)
    threads.emplace_back(worker);
  for (auto &t : threads)
    t.join();

  // **---- FAILURE / CANCELLATION ----**

  if (token && token->is_cancelled()) {
    LOG_WARN("[Task {}] Chunked encode cancelled", task_id);
    return Status(ErrorCode::Cancelled, "chunked encode cancelled");
  }
  if (failed_index >= 0) {
    return Status(ErrorCode::PartialChunkFailure,
                  fmt::format("chunk {} failed: {}", failed_index,
                              first_error.describe()));
  }

  std::vector<ChunkOutcome> outcomes = collector.extract();
  if (outcomes.size() != total) {
    return Status(ErrorCode::PartialChunkFailure,
                  fmt::format("{} of {} chunks finished", outcomes.size(),
                              total));
  }

  // **---- CONCATENATION ----**

  std::vector<std::string> parts;
  parts.reserve(outcomes.size());
  for (const auto &o : outcomes) {
    parts.push_back(o.output_path);
    result.frames += o.frames;
  }

  LOG_PHASE("[Task {}] Concatenating {} chunks", task_id, parts.size());
  TIMER_START(concat);
  Status st = copier.concat(parts, config.input_path, config.output_path,
                            token);
  if (!st.is_ok())
    return st;
  TIMER_END(concat, fmt::format("[Task {}] concat", task_id));

  result.chunks = std::move(outcomes);
  result.warnings = std::move(warnings);
  return Status::ok();
}

} // namespace crf_target
