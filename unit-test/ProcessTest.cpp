#include "exec/process.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace pyexec;

static execution_outcome run_shell(const string &script, chrono::milliseconds wall_limit = chrono::seconds(10)) {
    process_options opt;
    opt.command = make_command("/bin/sh", "-c", script);
    opt.wall_limit = wall_limit;
    return run_process(opt);
}

TEST(ProcessTest, CapturesStreamsSeparately) {
    auto outcome = run_shell("echo out; echo err >&2; echo more out");
    EXPECT_EQ(outcome.exitcode, 0);
    EXPECT_EQ(outcome.signal, -1);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.stdout_text, "out\nmore out\n");
    EXPECT_EQ(outcome.stderr_text, "err\n");
}

TEST(ProcessTest, ReportsExitCode) {
    auto outcome = run_shell("echo failing >&2; exit 3");
    EXPECT_EQ(outcome.exitcode, 3);
    EXPECT_EQ(outcome.stderr_text, "failing\n");
    EXPECT_FALSE(outcome.timed_out);
}

TEST(ProcessTest, StdinIsEmpty) {
    auto outcome = run_shell("cat; echo done");
    EXPECT_EQ(outcome.exitcode, 0);
    EXPECT_EQ(outcome.stdout_text, "done\n");
}

TEST(ProcessTest, ReportsTerminatingSignal) {
    auto outcome = run_shell("kill -9 $$");
    EXPECT_EQ(outcome.signal, 9);
    EXPECT_EQ(outcome.exitcode, 128 + 9);
    EXPECT_FALSE(outcome.timed_out);
}

TEST(ProcessTest, KillsProcessGroupOnTimeout) {
    elapsed_time timer;
    auto outcome = run_shell("echo started; sleep 30 & sleep 30", chrono::milliseconds(500));
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_NE(outcome.exitcode, 0);
    EXPECT_EQ(outcome.stdout_text, "started\n");
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
    EXPECT_GE(outcome.wall_time, 0.5);
}

TEST(ProcessTest, DoesNotWaitForBackgroundDescendants) {
    // 子进程退出后，后台进程继续持有管道
    elapsed_time timer;
    auto outcome = run_shell("echo parent; sleep 5 & exit 0");
    EXPECT_EQ(outcome.exitcode, 0);
    EXPECT_EQ(outcome.stdout_text, "parent\n");
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 4000);
}

TEST(ProcessTest, MissingCommandExitsWith127) {
    process_options opt;
    opt.command = make_command("/nonexistent/pyexec-command");
    auto outcome = run_process(opt);
    EXPECT_EQ(outcome.exitcode, 127);
    EXPECT_NE(outcome.stderr_text.find("unable to start command /nonexistent/pyexec-command"), string::npos);
}

TEST(ProcessTest, EmptyCommandIsRejected) {
    process_options opt;
    EXPECT_THROW(run_process(opt), invalid_argument);
}

TEST(ProcessTest, KeepsTailOfLargeOutput) {
    process_options opt;
    opt.command = make_command("/bin/sh", "-c", "i=0; while [ $i -lt 2000 ]; do echo line$i >&2; i=$((i+1)); done; echo '{\"last\": 1}' >&2");
    opt.wall_limit = chrono::seconds(10);
    opt.stream_limit = 1024;
    auto outcome = run_process(opt);
    EXPECT_EQ(outcome.exitcode, 0);
    EXPECT_LE(outcome.stderr_text.size(), 2 * opt.stream_limit + 4096);
    EXPECT_GE(outcome.stderr_text.size(), opt.stream_limit);
    string tail = "{\"last\": 1}\n";
    ASSERT_GE(outcome.stderr_text.size(), tail.size());
    EXPECT_EQ(outcome.stderr_text.substr(outcome.stderr_text.size() - tail.size()), tail);
}
