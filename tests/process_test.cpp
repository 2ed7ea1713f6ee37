/**
 * @file process_test.cpp
 * @brief Tests for external process execution and cancellation
 */

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "crf_target/process.hpp"

#include "fakes.hpp"

using namespace crf_target;
using namespace crf_target::testing_support;

TEST(RunProcessTest, SuccessfulCommand) {
  ProcessResult result;
  Status st = run_process({"/bin/sh", "-c", "exit 0"}, LineCallback(),
                          CancelToken::create(), result);

  ASSERT_TRUE(st.is_ok()) << st.describe();
  ASSERT_EQ(result.exit_code, 0);
  ASSERT_FALSE(result.cancelled);
}

TEST(RunProcessTest, NonZeroExitIsFailure) {
  ProcessResult result;
  Status st = run_process({"/bin/sh", "-c", "echo broken >&2; exit 3"},
                          LineCallback(), nullptr, result);

  ASSERT_EQ(st.code, ErrorCode::ProcessFailed);
  ASSERT_EQ(result.exit_code, 3);
  ASSERT_NE(st.message.find("broken"), std::string::npos);
}

TEST(RunProcessTest, StderrIsSplitIntoLines) {
  std::vector<std::string> lines;
  ProcessResult result;
  Status st = run_process(
      {"/bin/sh", "-c", "printf 'one\\ntwo\\rthree' >&2"},
      [&lines](const std::string &line) { lines.push_back(line); }, nullptr,
      result);

  ASSERT_TRUE(st.is_ok());
  std::vector<std::string> expected = {"one", "two", "three"};
  ASSERT_EQ(lines, expected);
}

TEST(RunProcessTest, TailKeepsLastLines) {
  ProcessOptions options;
  options.tail_lines = 2;
  ProcessResult result;
  Status st = run_process({"/bin/sh", "-c", "printf 'a\\nb\\nc\\n' >&2"},
                          LineCallback(), nullptr, result, options);

  ASSERT_TRUE(st.is_ok());
  ASSERT_EQ(result.stderr_tail.size(), 2u);
  ASSERT_EQ(result.tail_text(), "b | c");
}

TEST(RunProcessTest, StdoutRedirect) {
  TempDir dir;
  ProcessOptions options;
  options.stdout_path = dir.file("out.txt");
  ProcessResult result;

  ASSERT_TRUE(run_process({"/bin/sh", "-c", "echo hello"}, LineCallback(),
                          nullptr, result, options)
                  .is_ok());
  ASSERT_EQ(read_file(options.stdout_path), "hello\n");
}

TEST(RunProcessTest, ArgumentsReachChildIntact) {
  TempDir dir;
  ProcessOptions options;
  options.stdout_path = dir.file("args.txt");
  ProcessResult result;

  ASSERT_TRUE(run_process({"/bin/sh", "-c", "printf '%s|' \"$@\"", "sh", "a",
                           "b c", "", "-crf"},
                          LineCallback(), nullptr, result, options)
                  .is_ok());
  ASSERT_EQ(read_file(options.stdout_path), "a|b c||-crf|");
}

TEST(RunProcessTest, UnwritableStdoutFails) {
  TempDir dir;
  ProcessOptions options;
  options.stdout_path = dir.file("missing/out.txt");
  ProcessResult result;

  Status st = run_process({"/bin/sh", "-c", "echo hello"}, LineCallback(),
                          nullptr, result, options);
  ASSERT_EQ(st.code, ErrorCode::ProcessFailed);
  ASSERT_EQ(result.exit_code, 126);
}

TEST(RunProcessTest, MissingProgramFails) {
  ProcessResult result;
  Status st = run_process({"/nonexistent/program"}, LineCallback(), nullptr,
                          result);

  ASSERT_EQ(st.code, ErrorCode::ProcessFailed);
  ASSERT_EQ(result.exit_code, 127);
}

TEST(RunProcessTest, CancellationKillsChild) {
  auto token = CancelToken::create();
  std::thread canceller([token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    token->cancel();
  });

  auto begin = std::chrono::steady_clock::now();
  ProcessResult result;
  Status st = run_process({"sleep", "30"}, LineCallback(), token, result);
  auto elapsed = std::chrono::steady_clock::now() - begin;
  canceller.join();

  ASSERT_TRUE(st.is_cancelled());
  ASSERT_TRUE(result.cancelled);
  ASSERT_LT(elapsed, std::chrono::seconds(10));
}

TEST(RunProcessTest, CancelledTokenDoesNotStart) {
  auto token = CancelToken::create();
  token->cancel();
  ProcessResult result;

  ASSERT_TRUE(run_process({"/bin/sh", "-c", "exit 0"}, LineCallback(), token,
                          result)
                  .is_cancelled());
}

TEST(SplitArgsTest, CollapsesWhitespace) {
  std::vector<std::string> expected = {"-x265-params", "aq-mode=3", "-g",
                                       "240"};
  ASSERT_EQ(split_args("  -x265-params aq-mode=3\t-g  240 "), expected);
  ASSERT_TRUE(split_args("").empty());
}

TEST(CancelTokenTest, ParentCancelsChildren) {
  auto parent = CancelToken::create();
  auto child = parent->make_child();
  auto sibling = parent->make_child();

  child->cancel();
  ASSERT_FALSE(parent->is_cancelled());
  ASSERT_FALSE(sibling->is_cancelled());

  parent->cancel();
  ASSERT_TRUE(sibling->is_cancelled());
  ASSERT_TRUE(parent->make_child()->is_cancelled());
}

TEST(CancelTokenTest, DroppedChildrenAreSkipped) {
  auto parent = CancelToken::create();
  auto kept = parent->make_child();
  parent->make_child();

  parent->cancel();
  ASSERT_TRUE(kept->is_cancelled());
  ASSERT_TRUE(kept->wait_for(std::chrono::milliseconds(0)));
}
