#include <gtest/gtest.h>

#include "exec/command_runner.hpp"

#include <string>

namespace uploader {
namespace {

TEST(CommandRunnerTest, CapturesStdoutStderrAndExitCode) {
    PosixCommandRunner runner;
    const CommandResult r = runner.Run({"/bin/sh", {"-c", "echo out; echo err >&2; exit 3"}});
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.stdout_text, "out\n");
    EXPECT_EQ(r.stderr_text, "err\n");
    EXPECT_FALSE(r.Succeeded());
    EXPECT_EQ(r.Describe(), "exit 3: err");
}

TEST(CommandRunnerTest, SuccessfulCommand) {
    PosixCommandRunner runner;
    const CommandResult r = runner.Run({"true", {}});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_TRUE(r.Succeeded());
}

TEST(CommandRunnerTest, ArgumentsAreNotShellInterpreted) {
    PosixCommandRunner runner;
    const CommandResult r = runner.Run({"printf", {"%s", "a b; echo injected"}});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_text, "a b; echo injected");
}

TEST(CommandRunnerTest, MissingProgramReports127) {
    PosixCommandRunner runner;
    const CommandResult r = runner.Run({"/nonexistent/docker", {"load"}});
    EXPECT_EQ(r.exit_code, 127);
    EXPECT_NE(r.stderr_text.find("cannot execute"), std::string::npos);
}

TEST(CommandRunnerTest, KilledBySignalIs128PlusSignal) {
    PosixCommandRunner runner;
    const CommandResult r = runner.Run({"/bin/sh", {"-c", "kill -TERM $$"}});
    EXPECT_EQ(r.exit_code, 128 + 15);
}

TEST(CommandRunnerTest, LargeOutputOnBothStreamsDoesNotDeadlock) {
    PosixCommandRunner runner;
    const CommandResult r = runner.Run(
        {"/bin/sh", {"-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i >&2; i=$((i+1)); done"}});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_GT(r.stdout_text.size(), 100000u);
    EXPECT_GT(r.stderr_text.size(), 100000u);
}

TEST(CommandRunnerTest, DescribeFallsBackToStdoutAndTruncates) {
    CommandResult r;
    r.exit_code = 1;
    r.stdout_text = "only stdout\n";
    EXPECT_EQ(r.Describe(), "exit 1: only stdout");

    r.stderr_text = std::string(5000, 'e') + "tail";
    const std::string d = r.Describe();
    EXPECT_EQ(d.size(), std::string("exit 1: ").size() + 1024);
    EXPECT_TRUE(d.ends_with("tail"));
}

TEST(CommandRunnerTest, DryRunPrintsAndSucceeds) {
    DryRunCommandRunner runner;
    const CommandResult r = runner.Run({"docker", {"push", "registry.local/org/app:1.0"}});
    EXPECT_TRUE(r.Succeeded());
    ASSERT_EQ(runner.Printed().size(), 1u);
    EXPECT_EQ(runner.Printed()[0].ToString(), "docker push registry.local/org/app:1.0");
}

TEST(CommandRunnerTest, ToStringQuotesArguments) {
    const Command cmd{"obsutil", {"cp", "/data/my file.tgz", "obs://bucket/x/"}};
    EXPECT_EQ(cmd.ToString(), "obsutil cp '/data/my file.tgz' obs://bucket/x/");
}

} // namespace
} // namespace uploader
