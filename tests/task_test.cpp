/**
 * @file task_test.cpp
 * @brief Tests for task configuration checks and output naming
 */

#include <gtest/gtest.h>

#include "crf_target/logging.hpp"
#include "crf_target/system.hpp"
#include "crf_target/task.hpp"

#include "fakes.hpp"

using namespace crf_target;
using namespace crf_target::testing_support;

class TaskConfigTest : public ::testing::Test {
protected:
  TaskConfig config;

  void SetUp() override {
    config.input_path = "/videos/movie.mkv";
    config.output_path = "/out/movie.mkv";
  }
};

TEST_F(TaskConfigTest, DefaultsAreValid) {
  ASSERT_TRUE(validate(config).is_ok());
}

TEST_F(TaskConfigTest, RejectsBadValues) {
  TaskConfig c = config;
  c.output_path = c.input_path;
  ASSERT_EQ(validate(c).code, ErrorCode::InvalidArgument);

  c = config;
  c.target = 0.0;
  ASSERT_EQ(validate(c).code, ErrorCode::InvalidArgument);

  c = config;
  c.target = 100.5;
  ASSERT_EQ(validate(c).code, ErrorCode::InvalidArgument);

  c = config;
  c.max_crf = -1;
  ASSERT_EQ(validate(c).code, ErrorCode::InvalidArgument);

  c = config;
  c.vmaf_subsample = 0;
  ASSERT_EQ(validate(c).code, ErrorCode::InvalidArgument);

  c = config;
  c.chunk_workers = 0;
  ASSERT_EQ(validate(c).code, ErrorCode::InvalidArgument);
}

TEST_F(TaskConfigTest, OutputNameCarriesSettings) {
  config.encoder = Encoder::LibSvtAv1;
  config.target = 95.5;
  config.pool = PoolMethod::HarmonicMean;
  config.vmaf_subsample = 5;

  ASSERT_EQ(output_file_name("/videos/movie.mp4", config),
            "movie.libsvtav1.vmaf95.5.harmonic_mean.subsample5.mp4");
}

TEST(EnumParseTest, RoundTripsNames) {
  Encoder e;
  ASSERT_TRUE(parse_encoder("hevc_nvenc", e));
  ASSERT_EQ(e, Encoder::HevcNvenc);
  ASSERT_FALSE(parse_encoder("h264", e));

  PoolMethod p;
  ASSERT_TRUE(parse_pool_method("min", p));
  ASSERT_EQ(p, PoolMethod::Min);

  Mode m;
  ASSERT_TRUE(parse_mode("chunked", m));
  ASSERT_EQ(m, Mode::Chunked);
}

TEST(SystemTest, ChunkWorkersFollowCpuBudget) {
  ASSERT_LE(calculate_chunk_workers(3, 2), 3);
  ASSERT_GE(calculate_chunk_workers(3, 2), 1);
  ASSERT_GE(calculate_chunk_workers(0, 2), 1);
  ASSERT_GE(calculate_chunk_workers(0, 1000), 1);
}

TEST(SystemTest, EtaFormatting) {
  ASSERT_EQ(format_time(3725.0), "01:02:05");
  ASSERT_EQ(format_eta(25.0, 0, 2500), "00:01:40");
  ASSERT_TRUE(format_eta(0.0, 10, 100).empty());
  ASSERT_TRUE(format_eta(25.0, 10, 0).empty());
}

TEST(SystemTest, ScopedTempFilesDeleteOnDestruction) {
  TempDir dir;
  std::string kept = dir.file("kept.mkv");
  write_file(kept, "x");
  {
    ScopedTempFiles temps;
    write_file(temps.add(dir.file("a.crf10.mkv")), "x");
    write_file(temps.add(dir.file("b.sample.mkv")), "x");
    temps.add(dir.file("never_created.mkv"));
  }
  ASSERT_FALSE(fs::exists(dir.file("a.crf10.mkv")));
  ASSERT_FALSE(fs::exists(dir.file("b.sample.mkv")));
  ASSERT_TRUE(fs::exists(kept));
}

TEST(TimingCollectorTest, RecordsAndClears) {
  TimingCollector::clear();
  TimingCollector::record("[Task t] search", 1500);
  TimingCollector::record("[Task t] final encode", 2500);

  auto entries = TimingCollector::snapshot();
  ASSERT_EQ(entries.size(), 2u);
  ASSERT_EQ(entries[0].name, "[Task t] search");
  ASSERT_EQ(entries[1].microseconds, 2500);

  TimingCollector::clear();
  ASSERT_TRUE(TimingCollector::snapshot().empty());
}
