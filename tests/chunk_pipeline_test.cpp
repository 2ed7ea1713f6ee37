/**
 * @file chunk_pipeline_test.cpp
 * @brief Tests for parallel chunk encoding and ordered concatenation
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

#include "crf_target/chunk_pipeline.hpp"
#include "crf_target/scene_splitter.hpp"

#include "fakes.hpp"

using namespace crf_target;
using namespace crf_target::testing_support;

namespace {

bool ends_with(const std::string &text, const std::string &suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

class ChunkPipelineTest : public ::testing::Test {
protected:
  TempDir dir;
  FakeEncodeRunner encoder;
  FakeQualityProber prober;
  FakeStreamCopier copier;
  TaskConfig config;
  ChunkPlan plan;

  void SetUp() override {
    config = test_config(dir, "movie");
    plan = plan_chunks({3.0, 6.0, 9.0}, 12.0, 1.0);
  }
};

TEST_F(ChunkPipelineTest, ChunksAreJoinedInIndexOrder) {
  /// Chunk 0 finishes last
  encoder.delay_for = [](const EncodeRequest &r) {
    return ends_with(r.output_path, "_chunk0000.mkv") ? 200 : 0;
  };
  CrfSearchEngine search(encoder, prober, copier);
  ChunkPipeline pipeline(search, encoder, copier);
  PipelineResult result;

  Status st = pipeline.run("t1", config, plan, CancelToken::create(), result);

  ASSERT_TRUE(st.is_ok()) << st.describe();
  ASSERT_EQ(result.chunks.size(), 4u);
  for (size_t i = 0; i < result.chunks.size(); ++i) {
    ASSERT_EQ(result.chunks[i].index, static_cast<int>(i));
    ASSERT_EQ(result.chunks[i].quality, 3);
    ASSERT_TRUE(result.chunks[i].target_met);
  }

  ASSERT_EQ(copier.concat_parts.size(), 4u);
  for (size_t i = 0; i < copier.concat_parts.size(); ++i) {
    ASSERT_TRUE(ends_with(copier.concat_parts[i],
                          fmt::format("t1_chunk{:04d}.mkv", i)));
  }

  std::string joined = read_file(config.output_path);
  size_t p0 = joined.find("start=0 ");
  size_t p1 = joined.find("start=3 ");
  size_t p2 = joined.find("start=6 ");
  size_t p3 = joined.find("start=9 ");
  ASSERT_NE(p0, std::string::npos);
  ASSERT_LT(p0, p1);
  ASSERT_LT(p1, p2);
  ASSERT_LT(p2, p3);
}

TEST_F(ChunkPipelineTest, ChunkFilesAreDeletedAfterConcat) {
  CrfSearchEngine search(encoder, prober, copier);
  ChunkPipeline pipeline(search, encoder, copier);
  PipelineResult result;

  ASSERT_TRUE(
      pipeline.run("t1", config, plan, CancelToken::create(), result).is_ok());
  ASSERT_TRUE(files_containing(dir.path(), "_chunk").empty());
}

TEST_F(ChunkPipelineTest, FixedQualitySkipsSearch) {
  config.fixed_crf = 22;
  CrfSearchEngine search(encoder, prober, copier);
  ChunkPipeline pipeline(search, encoder, copier);
  PipelineResult result;

  ASSERT_TRUE(
      pipeline.run("t1", config, plan, CancelToken::create(), result).is_ok());
  ASSERT_EQ(prober.measurements.load(), 0);
  ASSERT_EQ(encoder.call_count(), plan.chunks.size());
  for (const auto &c : result.chunks)
    ASSERT_EQ(c.quality, 22);
}

TEST_F(ChunkPipelineTest, FailedChunkFailsTaskWithoutOutput) {
  /// Three chunks on three workers: chunk 2 fails while its siblings encode
  plan = plan_chunks({4.0, 8.0}, 12.0, 1.0);
  ASSERT_EQ(plan.chunks.size(), 3u);
  config.fixed_crf = 20;
  encoder.fail_if = [](const EncodeRequest &r) {
    return ends_with(r.output_path, "_chunk0002.mkv");
  };
  encoder.delay_for = [](const EncodeRequest &r) {
    return ends_with(r.output_path, "_chunk0002.mkv") ? 0 : 3000;
  };
  CrfSearchEngine search(encoder, prober, copier);
  ChunkPipeline pipeline(search, encoder, copier);
  PipelineResult result;

  auto begin = std::chrono::steady_clock::now();
  Status st = pipeline.run("t1", config, plan, CancelToken::create(), result);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - begin)
                     .count();

  ASSERT_EQ(st.code, ErrorCode::PartialChunkFailure);
  ASSERT_NE(st.message.find("chunk 2"), std::string::npos);
  ASSERT_GT(encoder.cancelled.load(), 0);
  ASSERT_LT(elapsed, 2500);
  ASSERT_FALSE(fs::exists(config.output_path));
  ASSERT_TRUE(copier.concat_parts.empty());
  ASSERT_TRUE(files_containing(dir.path(), "_chunk").empty());
}

TEST_F(ChunkPipelineTest, UnreachableChunkIsAWarning) {
  prober.score = [](int) { return 40.0; };
  CrfSearchEngine search(encoder, prober, copier);
  ChunkPipeline pipeline(search, encoder, copier);
  PipelineResult result;

  Status st = pipeline.run("t1", config, plan, CancelToken::create(), result);

  ASSERT_TRUE(st.is_ok()) << st.describe();
  ASSERT_EQ(result.warnings.size(), plan.chunks.size());
  for (const auto &c : result.chunks) {
    ASSERT_EQ(c.quality, 0);
    ASSERT_FALSE(c.target_met);
  }
}

TEST_F(ChunkPipelineTest, CancellationStopsWorkers) {
  encoder.delay_for = [](const EncodeRequest &) { return 5000; };
  CrfSearchEngine search(encoder, prober, copier);
  ChunkPipeline pipeline(search, encoder, copier);
  PipelineResult result;
  auto token = CancelToken::create();

  std::thread canceller([token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token->cancel();
  });
  Status st = pipeline.run("t1", config, plan, token, result);
  canceller.join();

  ASSERT_TRUE(st.is_cancelled());
  ASSERT_GT(encoder.cancelled.load(), 0);
  ASSERT_FALSE(fs::exists(config.output_path));
  ASSERT_TRUE(files_containing(dir.path(), "_chunk").empty());
}

TEST_F(ChunkPipelineTest, ProgressCountsFinishedChunks) {
  config.fixed_crf = 20;
  CrfSearchEngine search(encoder, prober, copier);
  ChunkPipeline pipeline(search, encoder, copier);
  PipelineResult result;

  std::mutex m;
  PipelineProgress last;
  auto on_progress = [&](const PipelineProgress &p) {
    std::lock_guard<std::mutex> lock(m);
    if (p.chunks_done >= last.chunks_done)
      last = p;
  };

  ASSERT_TRUE(pipeline
                  .run("t1", config, plan, CancelToken::create(), result,
                       on_progress)
                  .is_ok());
  ASSERT_EQ(last.chunks_done, 4);
  ASSERT_EQ(last.chunks_total, 4);
  ASSERT_EQ(last.frames, 300u);
  ASSERT_EQ(result.frames, 300u);
}

TEST_F(ChunkPipelineTest, IndicesNeedNotStartAtZero) {
  plan.chunks = {{0.0, 4.0, 1}, {4.0, 8.0, 2}, {8.0, 12.0, 3}};
  config.fixed_crf = 20;
  CrfSearchEngine search(encoder, prober, copier);
  ChunkPipeline pipeline(search, encoder, copier);
  PipelineResult result;

  std::mutex m;
  PipelineProgress last;
  auto on_progress = [&](const PipelineProgress &p) {
    std::lock_guard<std::mutex> lock(m);
    if (p.chunks_done >= last.chunks_done)
      last = p;
  };

  Status st = pipeline.run("t1", config, plan, CancelToken::create(), result,
                           on_progress);

  ASSERT_TRUE(st.is_ok()) << st.describe();
  ASSERT_EQ(last.chunks_done, 3);
  ASSERT_EQ(last.chunks_total, 3);
  ASSERT_EQ(result.chunks.size(), 3u);
  ASSERT_EQ(result.chunks.front().index, 1);
  ASSERT_EQ(result.chunks.back().index, 3);
  ASSERT_TRUE(ends_with(copier.concat_parts.front(), "t1_chunk0001.mkv"));
}

TEST_F(ChunkPipelineTest, DuplicateIndicesAreRejected) {
  plan.chunks = {{0.0, 6.0, 0}, {6.0, 12.0, 0}};
  CrfSearchEngine search(encoder, prober, copier);
  ChunkPipeline pipeline(search, encoder, copier);
  PipelineResult result;

  ASSERT_EQ(pipeline.run("t1", config, plan, CancelToken::create(), result)
                .code,
            ErrorCode::InvalidArgument);
  ASSERT_EQ(encoder.call_count(), 0u);
}

TEST_F(ChunkPipelineTest, EmptyPlanIsRejected) {
  CrfSearchEngine search(encoder, prober, copier);
  ChunkPipeline pipeline(search, encoder, copier);
  PipelineResult result;

  ASSERT_EQ(pipeline.run("t1", config, ChunkPlan(), CancelToken::create(),
                         result)
                .code,
            ErrorCode::InvalidArgument);
}
