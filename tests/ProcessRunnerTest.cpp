#include <gtest/gtest.h>
#include "utils/ProcessRunner.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace MediaBot;

namespace {

CommandSpec shell(const std::string& script, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
    CommandSpec spec;
    spec.program = "/bin/sh";
    spec.args = {"-c", script};
    spec.timeout = timeout;
    return spec;
}

} // namespace

TEST(ProcessRunnerTest, CapturesStdoutAndStderr)
{
    PosixCommandRunner runner;
    CommandResult result = runner.run(shell("echo hello; echo oops 1>&2"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_EQ(result.errorOutput, "oops\n");
    EXPECT_TRUE(result.error.empty());
}

TEST(ProcessRunnerTest, NonZeroExitReportsStderr)
{
    PosixCommandRunner runner;
    CommandResult result = runner.run(shell("echo 'HTTP Error 403: Forbidden' 1>&2; exit 3"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_EQ(result.error, "/bin/sh failed: HTTP Error 403: Forbidden");
}

TEST(ProcessRunnerTest, SilentFailureReportsExitCode)
{
    PosixCommandRunner runner;
    CommandResult result = runner.run(shell("exit 2"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "/bin/sh failed: exited with code 2");
}

TEST(ProcessRunnerTest, TimeoutKillsProcessGroup)
{
    PosixCommandRunner runner;
    const auto start = std::chrono::steady_clock::now();
    CommandResult result = runner.run(shell("sleep 5 & sleep 5; wait", std::chrono::milliseconds(200)));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.timedOut);
    EXPECT_NE(result.error.find("timed out after 200 ms"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(ProcessRunnerTest, PresetCancelFlagSkipsExecution)
{
    auto cancel = std::make_shared<std::atomic<bool>>(true);
    PosixCommandRunner runner(cancel);
    CommandResult result = runner.run(shell("echo never"));

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.output.empty());
}

TEST(ProcessRunnerTest, CancelDuringRunStopsChild)
{
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    PosixCommandRunner runner(cancel);

    std::thread canceller([cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancel->store(true);
    });
    CommandResult result = runner.run(shell("sleep 5"));
    canceller.join();

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.error, "/bin/sh cancelled");
}

TEST(ProcessRunnerTest, MissingProgramFails)
{
    PosixCommandRunner runner;
    CommandSpec spec;
    spec.program = "mediabot-definitely-not-installed";
    CommandResult result = runner.run(spec);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exitCode, 127);
    EXPECT_NE(result.error.find("mediabot-definitely-not-installed"), std::string::npos);
    EXPECT_NE(result.errorOutput.find("exec mediabot-definitely-not-installed: "), std::string::npos);
}

TEST(ProcessRunnerTest, OutputIsCapped)
{
    PosixCommandRunner runner(nullptr, 16);
    CommandResult result = runner.run(shell("i=0; while [ $i -lt 100 ]; do echo 0123456789; i=$((i+1)); done"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output.size(), 16u);
}

TEST(ProcessRunnerTest, DescribeQuotesArgumentsWithSpaces)
{
    CommandSpec spec;
    spec.program = "yt-dlp";
    spec.args = {"--print", "%(title)s", "-o", "/tmp/a b/audio.%(ext)s"};
    EXPECT_EQ(describeCommand(spec), "yt-dlp --print %(title)s -o \"/tmp/a b/audio.%(ext)s\"");
}
