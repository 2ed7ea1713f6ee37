/**
 * @file scene_splitter_test.cpp
 * @brief Tests for chunk planning and the scene detection fallback
 */

#include <gtest/gtest.h>

#include "crf_target/scene_splitter.hpp"

#include "fakes.hpp"

using namespace crf_target;
using namespace crf_target::testing_support;

namespace {

/// Chunks are contiguous, ordered and cover [0, duration]
void expect_covering(const ChunkPlan &plan, double duration) {
  ASSERT_FALSE(plan.chunks.empty());
  ASSERT_DOUBLE_EQ(plan.chunks.front().start, 0.0);
  ASSERT_DOUBLE_EQ(plan.chunks.back().end, duration);
  for (size_t i = 0; i < plan.chunks.size(); ++i) {
    ASSERT_EQ(plan.chunks[i].index, static_cast<int>(i));
    ASSERT_LT(plan.chunks[i].start, plan.chunks[i].end);
    if (i > 0)
      ASSERT_DOUBLE_EQ(plan.chunks[i].start, plan.chunks[i - 1].end);
  }
}

} // anonymous namespace

TEST(PlanChunksTest, CutsBecomeBoundaries) {
  ChunkPlan plan = plan_chunks({3.0, 7.5}, 12.0, 2.0);

  expect_covering(plan, 12.0);
  ASSERT_EQ(plan.chunks.size(), 3u);
  ASSERT_DOUBLE_EQ(plan.chunks[1].start, 3.0);
  ASSERT_DOUBLE_EQ(plan.chunks[2].start, 7.5);
  ASSERT_TRUE(plan.from_scene_detection);
}

TEST(PlanChunksTest, CloseCutsAreMerged) {
  ChunkPlan plan = plan_chunks({0.5, 3.0, 3.5, 4.0, 9.0}, 12.0, 2.0);

  expect_covering(plan, 12.0);
  std::vector<double> starts;
  for (const auto &c : plan.chunks)
    starts.push_back(c.start);
  std::vector<double> expected = {0.0, 3.0, 9.0};
  ASSERT_EQ(starts, expected);
}

TEST(PlanChunksTest, UnsortedAndOutOfRangeCutsAreIgnored) {
  ChunkPlan plan = plan_chunks({8.0, -1.0, 4.0, 12.0, 30.0}, 12.0, 1.0);

  expect_covering(plan, 12.0);
  ASSERT_EQ(plan.chunks.size(), 3u);
}

TEST(PlanChunksTest, NoCutsGiveOneChunk) {
  ChunkPlan plan = plan_chunks({}, 5.0, 2.0);

  expect_covering(plan, 5.0);
  ASSERT_EQ(plan.chunks.size(), 1u);
}

TEST(PlanChunksTest, FixedPlanCoversDuration) {
  ChunkPlan plan = plan_fixed_chunks(7.0, 2.0);

  expect_covering(plan, 7.0);
  ASSERT_EQ(plan.chunks.size(), 4u);
  ASSERT_DOUBLE_EQ(plan.chunks.back().start, 6.0);
  ASSERT_FALSE(plan.from_scene_detection);
}

TEST(ParsePtsTimeTest, ReadsShowinfoLine) {
  double t = 0.0;
  ASSERT_TRUE(parse_pts_time("[Parsed_showinfo_1 @ 0x5] n:   3 pts:  90090 "
                             "pts_time:3.003   duration:3003",
                             t));
  ASSERT_DOUBLE_EQ(t, 3.003);
  ASSERT_FALSE(parse_pts_time("frame=  10 fps=0.0", t));
}

class SceneSplitterTest : public ::testing::Test {
protected:
  FakeMediaProbe probe;
  FakeSceneDetector detector;
};

TEST_F(SceneSplitterTest, UsesDetectedScenes) {
  detector.cuts = {4.0, 8.0};
  SceneSplitter splitter(probe, detector, 0.4);
  ChunkPlan plan;

  Status st = splitter.plan("in.mkv", 2.0, CancelToken::create(), plan);

  ASSERT_TRUE(st.is_ok()) << st.describe();
  expect_covering(plan, 12.0);
  ASSERT_EQ(plan.chunks.size(), 3u);
}

TEST_F(SceneSplitterTest, DetectorFailureFallsBackToFixedChunks) {
  detector.fail = true;
  SceneSplitter splitter(probe, detector, 0.4);
  ChunkPlan plan;

  Status st = splitter.plan("in.mkv", 5.0, CancelToken::create(), plan);

  ASSERT_EQ(st.code, ErrorCode::SceneDetectionUnavailable);
  expect_covering(plan, 12.0);
  ASSERT_EQ(plan.chunks.size(), 3u);
  ASSERT_FALSE(plan.from_scene_detection);
}

TEST_F(SceneSplitterTest, NoCutsFallsBackToFixedChunks) {
  SceneSplitter splitter(probe, detector, 0.4);
  ChunkPlan plan;

  Status st = splitter.plan("in.mkv", 4.0, CancelToken::create(), plan);

  ASSERT_EQ(st.code, ErrorCode::SceneDetectionUnavailable);
  expect_covering(plan, 12.0);
}

TEST_F(SceneSplitterTest, ProbeFailureGivesNoPlan) {
  probe.fail = true;
  SceneSplitter splitter(probe, detector, 0.4);
  ChunkPlan plan;

  Status st = splitter.plan("in.mkv", 2.0, CancelToken::create(), plan);

  ASSERT_EQ(st.code, ErrorCode::ProbeFailed);
  ASSERT_TRUE(plan.chunks.empty());
}

TEST_F(SceneSplitterTest, NonPositiveMinimumIsRejected) {
  SceneSplitter splitter(probe, detector, 0.4);
  ChunkPlan plan;

  ASSERT_EQ(splitter.plan("in.mkv", 0.0, CancelToken::create(), plan).code,
            ErrorCode::InvalidArgument);
}
