/**
 * @file encode_runner_test.cpp
 * @brief Tests for encoder command lines and status line parsing
 */

#include <gtest/gtest.h>

#include <algorithm>

#include "crf_target/encode_runner.hpp"

using namespace crf_target;

namespace {

bool contains_sequence(const std::vector<std::string> &args,
                       const std::vector<std::string> &seq) {
  return std::search(args.begin(), args.end(), seq.begin(), seq.end()) !=
         args.end();
}

} // anonymous namespace

TEST(QualityArgsTest, PerEncoderFlags) {
  ASSERT_EQ(quality_args(Encoder::Libx265, 23),
            (std::vector<std::string>{"-crf", "23"}));
  ASSERT_EQ(quality_args(Encoder::LibSvtAv1, 30),
            (std::vector<std::string>{"-crf", "30"}));
  ASSERT_EQ(quality_args(Encoder::LibAomAv1, 30),
            (std::vector<std::string>{"-crf", "30", "-b:v", "0"}));
  ASSERT_EQ(quality_args(Encoder::HevcQsv, 25),
            (std::vector<std::string>{"-global_quality", "25"}));
  ASSERT_EQ(quality_args(Encoder::HevcNvenc, 19),
            (std::vector<std::string>{"-rc:v", "vbr", "-cq:v", "19", "-qmin",
                                      "19", "-qmax", "19"}));
}

TEST(ParseProgressLineTest, ReadsStatusLine) {
  EncodeProgress p;
  ASSERT_TRUE(parse_progress_line("frame=  240 fps= 48 q=28.0 size=    "
                                  "1024kB time=00:00:10.00 bitrate= 838.9kbits/s "
                                  "speed=1.9x",
                                  p));
  ASSERT_EQ(p.frame, 240u);
  ASSERT_DOUBLE_EQ(p.fps, 48.0);
  ASSERT_EQ(p.bytes, 1024u * 1024u);
}

TEST(ParseProgressLineTest, FinalLineAndMebibytes) {
  EncodeProgress p;
  ASSERT_TRUE(parse_progress_line(
      "frame= 1500 fps=60.5 q=-1.0 Lsize=    2.5MiB time=00:01:00.00", p));
  ASSERT_EQ(p.frame, 1500u);
  ASSERT_DOUBLE_EQ(p.fps, 60.5);
  ASSERT_EQ(p.bytes, static_cast<uint64_t>(2.5 * 1024 * 1024));
}

TEST(ParseProgressLineTest, IgnoresOtherLines) {
  EncodeProgress p;
  ASSERT_FALSE(parse_progress_line("Input #0, matroska,webm, from 'a.mkv':", p));
  ASSERT_FALSE(parse_progress_line("", p));
}

TEST(EncodeArgsTest, WindowedVideoOnlyEncode) {
  FfmpegEncodeRunner runner("ffmpeg");
  EncodeRequest req;
  req.input_path = "in.mkv";
  req.output_path = "out.mkv";
  req.encoder = Encoder::Libx265;
  req.quality = 22;
  req.preset = "slow";
  req.extra_params = "-x265-params  aq-mode=3";
  req.pix_fmt = "yuv420p10le";
  req.start = 5.0;
  req.end = 9.5;

  auto args = runner.build_args(req);

  ASSERT_EQ(args.front(), "ffmpeg");
  ASSERT_EQ(args.back(), "out.mkv");
  ASSERT_TRUE(contains_sequence(args, {"-ss", "5.000", "-to", "9.500", "-i",
                                       "in.mkv"}));
  ASSERT_TRUE(contains_sequence(args, {"-an", "-sn"}));
  ASSERT_TRUE(contains_sequence(args, {"-c:v", "libx265"}));
  ASSERT_TRUE(contains_sequence(args, {"-preset", "slow"}));
  ASSERT_TRUE(contains_sequence(args, {"-x265-params", "aq-mode=3"}));
  ASSERT_TRUE(contains_sequence(args, {"-crf", "22"}));
  ASSERT_TRUE(contains_sequence(args, {"-pix_fmt", "yuv420p10le"}));
}

TEST(EncodeArgsTest, FinalEncodeCopiesOtherStreams) {
  FfmpegEncodeRunner runner("ffmpeg");
  EncodeRequest req;
  req.input_path = "in.mkv";
  req.output_path = "out.mkv";
  req.encoder = Encoder::LibAomAv1;
  req.quality = 30;
  req.preset = "4";
  req.copy_other_streams = true;

  auto args = runner.build_args(req);

  ASSERT_EQ(std::find(args.begin(), args.end(), "-ss"), args.end());
  ASSERT_TRUE(contains_sequence(args, {"-map", "0:a?", "-map", "0:s?"}));
  ASSERT_TRUE(contains_sequence(args, {"-cpu-used", "4"}));
  ASSERT_EQ(std::find(args.begin(), args.end(), "-an"), args.end());
}
