#include "debsnap/system/command_runner.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace debsnap {
namespace {

TEST(CommandRunnerTest, CapturesStdoutStderrAndExitCode) {
    PosixCommandRunner runner;
    CommandOutput out;
    auto r = runner.Run({.argv = {"/bin/sh", "-c", "echo hello; echo oops >&2; exit 3"}}, out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out.exit_code, 3);
    EXPECT_EQ(out.out, "hello\n");
    EXPECT_EQ(out.err, "oops\n");
    EXPECT_FALSE(out.Succeeded());
}

TEST(CommandRunnerTest, RunsInWorkingDirectoryWithExtraEnvironment) {
    testutil::TemporaryDirectory tmp;
    PosixCommandRunner runner;
    CommandOutput out;
    CommandSpec spec;
    spec.argv = {"/bin/sh", "-c", "pwd; echo \"$DEBIAN_FRONTEND\""};
    spec.cwd = tmp.Path();
    spec.env = {{"DEBIAN_FRONTEND", "noninteractive"}};

    ASSERT_TRUE(runner.Run(spec, out).is_ok());
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_EQ(out.out, std::filesystem::canonical(tmp.Path()).string() + "\nnoninteractive\n");
}

TEST(CommandRunnerTest, DrainsLargeOutputWithoutDeadlock) {
    PosixCommandRunner runner;
    CommandOutput out;
    auto r = runner.Run({.argv = {"/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i >&2; "
                                                   "i=$((i+1)); done"}},
                        out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_GT(out.out.size(), 100000u);
    EXPECT_GT(out.err.size(), 100000u);
}

TEST(CommandRunnerTest, MissingProgramIsAnError) {
    PosixCommandRunner runner;
    CommandOutput out;
    auto r = runner.Run({.argv = {"debsnap-no-such-tool-xyz"}}, out);
    EXPECT_FALSE(r.is_ok());
}

TEST(CommandRunnerTest, LastLinesAndDescribe) {
    EXPECT_EQ(LastLines("a\nb\nc\n", 2), "b\nc");
    EXPECT_EQ(LastLines("single", 3), "single");
    EXPECT_EQ(LastLines("", 3), "");
    EXPECT_EQ(DescribeCommand({"dpkg", "-l", "linux-image-*"}), "dpkg -l 'linux-image-*'");
}

TEST(CommandRunnerTest, RequireToolsNamesEveryMissingTool) {
    EXPECT_TRUE(FindInPath("sh").has_value());
    auto r = RequireTools({"sh", "debsnap-missing-a", "debsnap-missing-b"});
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("debsnap-missing-a"), std::string::npos);
    EXPECT_NE(r.msg.find("debsnap-missing-b"), std::string::npos);
    EXPECT_EQ(r.msg.find("sh,"), std::string::npos);
}

} // namespace
} // namespace debsnap
