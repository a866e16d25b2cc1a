#include "executor.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace {

int run_line(const std::string& line, executor::ExecutionContext& ctx) {
    std::ostringstream out;
    return executor::execute(parser::parse_line(line), ctx, out);
}

TEST(ExecutorTest, EmptyCommandIsNoop) {
    executor::ExecutionContext ctx;
    EXPECT_EQ(run_line("", ctx), 0);
    EXPECT_FALSE(ctx.should_exit);
}

TEST(ExecutorTest, ExternalCommandInheritsStdout) {
    executor::ExecutionContext ctx;
    testing::internal::CaptureStdout();
    const int status = run_line("echo hello", ctx);
    const std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(status, 0);
    EXPECT_EQ(output, "hello\n");
    EXPECT_EQ(ctx.last_status, 0);
}

TEST(ExecutorTest, ArgumentsArePassedInOrder) {
    executor::ExecutionContext ctx;
    testing::internal::CaptureStdout();
    run_line("printf %s-%s-%s one two three", ctx);
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "one-two-three");
}

TEST(ExecutorTest, ReportsChildExitCode) {
    executor::ExecutionContext ctx;
    EXPECT_EQ(run_line("sh -c 'exit 3'", ctx), 3);
    EXPECT_EQ(ctx.last_status, 3);
    EXPECT_FALSE(ctx.should_exit);
}

TEST(ExecutorTest, ReportsTerminatingSignal) {
    executor::ExecutionContext ctx;
    EXPECT_EQ(run_line("sh -c 'kill -TERM $$'", ctx), 128 + 15);
}

TEST(ExecutorTest, UnknownCommandReportsError) {
    executor::ExecutionContext ctx;
    testing::internal::CaptureStderr();
    const int status = run_line("minish-no-such-command --flag", ctx);
    const std::string errors = testing::internal::GetCapturedStderr();

    EXPECT_EQ(status, executor::STATUS_NOT_FOUND);
    EXPECT_NE(errors.find("minish-no-such-command: command not found"), std::string::npos);
    EXPECT_FALSE(ctx.should_exit);
}

TEST(ExecutorTest, NonExecutableFileReportsError) {
    executor::ExecutionContext ctx;
    testing::internal::CaptureStderr();
    const int status = run_line("/dev/null", ctx);
    const std::string errors = testing::internal::GetCapturedStderr();

    EXPECT_EQ(status, executor::STATUS_NOT_EXECUTABLE);
    EXPECT_NE(errors.find("minish: /dev/null:"), std::string::npos);
}

TEST(ExecutorTest, BuiltinsRunInProcess) {
    executor::ExecutionContext ctx;
    std::ostringstream out;
    EXPECT_EQ(executor::execute(parser::parse_line("help"), ctx, out), 0);
    EXPECT_FALSE(out.str().empty());

    EXPECT_EQ(executor::execute(parser::parse_line("exit"), ctx, out), 0);
    EXPECT_TRUE(ctx.should_exit);
}

} // namespace
