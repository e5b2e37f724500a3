// Subprocess tests
//
// Exercise run_process/find_program against standard POSIX tools.

#include "backend/process.hpp"

#include <gtest/gtest.h>

using namespace kindred::backend;

TEST(ProcessTest, SuccessfulExit) {
    auto result = run_process("true", {}, 10);
    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
}

TEST(ProcessTest, FailingExit) {
    auto result = run_process("false", {}, 10);
    EXPECT_TRUE(result.launched);
    EXPECT_NE(result.exit_code, 0);
}

TEST(ProcessTest, CapturesBothStreams) {
    auto result = run_process("sh", {"-c", "echo out; echo err 1>&2; exit 3"}, 10);
    ASSERT_TRUE(result.launched);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
}

TEST(ProcessTest, LargeOutputDoesNotBlock) {
    // Well past a default 64 KiB pipe buffer.
    auto result = run_process("sh", {"-c", "head -c 300000 /dev/zero | tr '\\0' x"}, 30);
    ASSERT_TRUE(result.launched);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output.size(), 300000u);
}

TEST(ProcessTest, TimeoutKillsChild) {
    auto result = run_process("sleep", {"30"}, 1);
    EXPECT_TRUE(result.launched);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_LT(result.duration_us, 20'000'000);
}

TEST(ProcessTest, MissingProgramIsNotLaunched) {
    auto result = run_process("kindred-no-such-program", {}, 10);
    EXPECT_FALSE(result.launched);
    EXPECT_FALSE(result.stderr_output.empty());
}

TEST(ProcessTest, FindProgramOnPath) {
    auto sh = find_program("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(sh->is_absolute());
    EXPECT_EQ(sh->filename(), "sh");
}

TEST(ProcessTest, FindProgramWithSlash) {
    auto sh = find_program("/bin/sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_FALSE(find_program("/nonexistent/dir/tool").has_value());
}

TEST(ProcessTest, FindProgramMissing) {
    EXPECT_FALSE(find_program("kindred-no-such-program").has_value());
}
