#include <gtest/gtest.h>

#include "exec_kernel/file_utils.h"
#include "exec_kernel/sandbox.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>
#include <vector>

using exec_kernel::ExecutionOutcome;
using exec_kernel::FileUtils;
using exec_kernel::RunnerOptions;
using exec_kernel::Sandbox;
using exec_kernel::SandboxPolicy;
using exec_kernel::TempDir;

namespace {

std::vector<std::string> sh(const std::string& script) {
    return {"/bin/sh", "-c", script};
}

bool exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

} // namespace

TEST(Sandbox, CapturesBothStreams) {
    auto r = Sandbox::run_with_timeout(sh("echo out; echo err 1>&2; exit 3"), 10);
    EXPECT_EQ(r.stdout_output, "out\n");
    EXPECT_EQ(r.stderr_output, "err\n");
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_FALSE(r.timed_out);
    EXPECT_FALSE(r.crashed);
    EXPECT_GE(r.elapsed_seconds, 0.0);
}

TEST(Sandbox, RunWithoutDeadline) {
    auto r = Sandbox::run(sh("sleep 0.2; echo done"));
    EXPECT_EQ(r.stdout_output, "done\n");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_FALSE(r.timed_out);
    EXPECT_GE(r.elapsed_seconds, 0.1);
}

TEST(Sandbox, RunWaitsAfterStreamsClose) {
    // Child closes both pipes first, then lingers before exiting
    auto r = Sandbox::run(sh("echo early; exec >&- 2>&-; sleep 0.3; exit 4"));
    EXPECT_EQ(r.stdout_output, "early\n");
    EXPECT_EQ(r.exit_code, 4);
    EXPECT_FALSE(r.timed_out);
    EXPECT_GE(r.elapsed_seconds, 0.2);
}

TEST(Sandbox, ParentDescriptorsAreNotInherited) {
    if (!exists("/proc/self/fd")) GTEST_SKIP() << "no /proc";
    int fd = open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);
    ASSERT_EQ(dup2(fd, 200), 200);
    auto r = Sandbox::run_with_timeout(
        sh("if [ -e /proc/$$/fd/200 ]; then echo inherited; else echo closed; fi"), 10);
    close(200);
    close(fd);
    EXPECT_EQ(r.stdout_output, "closed\n");
}

TEST(Sandbox, EnvironmentIsNotInherited) {
    setenv("EXEC_KERNEL_TEST_SECRET", "hunter2", 1);
    SandboxPolicy policy;
    policy.env = {"ONLY_THIS=1"};
    auto r = Sandbox::run_with_timeout(sh("echo \"[$ONLY_THIS][$EXEC_KERNEL_TEST_SECRET]\""), 10, policy);
    EXPECT_EQ(r.stdout_output, "[1][]\n");
    unsetenv("EXEC_KERNEL_TEST_SECRET");
}

TEST(Sandbox, TimeoutKillsChild) {
    auto r = Sandbox::run_with_timeout(sh("echo started; sleep 30"), 0.5);
    EXPECT_TRUE(r.timed_out);
    EXPECT_FALSE(r.crashed);
    EXPECT_LT(r.elapsed_seconds, 10.0);
}

TEST(Sandbox, TimeoutKillsWholeProcessGroup) {
    // The background sleeper keeps the pipes open; killing only the shell would hang.
    auto r = Sandbox::run_with_timeout(sh("sleep 30 & sleep 30"), 0.5);
    EXPECT_TRUE(r.timed_out);
    EXPECT_LT(r.elapsed_seconds, 10.0);
}

TEST(Sandbox, BackgroundHelpersDoNotOutliveRun) {
    auto r = Sandbox::run_with_timeout(sh("sleep 30 & echo done"), 10);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.stdout_output, "done\n");
    EXPECT_LT(r.elapsed_seconds, 10.0);
}

TEST(Sandbox, DetectsCrash) {
    auto r = Sandbox::run_with_timeout(sh("echo before; kill -SEGV $$"), 10);
    EXPECT_TRUE(r.crashed);
    EXPECT_EQ(r.term_signal, SIGSEGV);
    EXPECT_EQ(r.stdout_output, "before\n");
}

TEST(Sandbox, LargeOutputDoesNotDeadlock) {
    // Well beyond a pipe buffer on both streams
    auto r = Sandbox::run_with_timeout(
        sh("i=0; while [ $i -lt 20000 ]; do echo 0123456789; echo abcdefghij 1>&2; i=$((i+1)); done"),
        30);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.stdout_output.size(), 20000u * 11u);
    EXPECT_EQ(r.stderr_output.size(), 20000u * 11u);
}

TEST(Sandbox, CaptureIsCapped) {
    SandboxPolicy policy;
    policy.max_capture_bytes = 100;
    auto r = Sandbox::run_with_timeout(
        sh("i=0; while [ $i -lt 1000 ]; do echo 0123456789; i=$((i+1)); done"), 30, policy);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_output.size(), 100u);
}

TEST(Sandbox, WorkingDirectory) {
    TempDir dir("exec_kernel-test-");
    SandboxPolicy policy;
    policy.working_dir = dir.path();
    auto r = Sandbox::run_with_timeout({"/bin/pwd"}, 10, policy);
    char resolved[4096];
    ASSERT_NE(realpath(dir.path().c_str(), resolved), nullptr);
    EXPECT_EQ(r.stdout_output, std::string(resolved) + "\n");
}

TEST(Sandbox, PublishPlotsInNumericOrder) {
    TempDir scratch("exec_kernel-test-");
    TempDir output("exec_kernel-test-");
    for (const char* name : {"plot_10.png", "plot_2.png", "plot_0.png", "plot_x.png", "other.png"}) {
        FileUtils::write_file(scratch.file(name), name);
    }
    auto published = Sandbox::publish_plots(scratch.path(), output.path());
    ASSERT_EQ(published.size(), 3u);
    EXPECT_EQ(published[0], output.file("plot_0.png"));
    EXPECT_EQ(published[1], output.file("plot_2.png"));
    EXPECT_EQ(published[2], output.file("plot_10.png"));
    EXPECT_TRUE(exists(output.file("plot_10.png")));
    EXPECT_FALSE(exists(output.file("other.png")));
}

TEST(Sandbox, RunProgramLayoutEnvironmentAndCleanup) {
    // A stand-in interpreter that reports how it was started
    TempDir tools("exec_kernel-test-");
    std::string fake = tools.file("fake-python");
    FileUtils::write_file(fake,
        "#!/bin/sh\n"
        "echo \"args: $1 $2\"\n"
        "/usr/bin/env\n"
        "/bin/ls \"$PYTHONPATH\"\n"
        "/bin/cat \"$PYTHONPATH/sandbox_script.py\"\n");
    ASSERT_EQ(chmod(fake.c_str(), 0700), 0);

    setenv("EXEC_KERNEL_TEST_SECRET", "hunter2", 1);
    std::string seen_dir;
    RunnerOptions options;
    options.interpreter = fake;
    auto outcome = Sandbox::run_program(
        [&](const std::string& scratch) {
            seen_dir = scratch;
            return std::string("# program for " + scratch + "\n");
        },
        10, options);
    unsetenv("EXEC_KERNEL_TEST_SECRET");

    ASSERT_FALSE(seen_dir.empty());
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.exit_code, 0);
    const std::string& out = outcome.stdout_output;
    EXPECT_NE(out.find("args: -m sandbox_script"), std::string::npos);
    EXPECT_NE(out.find("PYTHONPATH=" + seen_dir + "\n"), std::string::npos);
    EXPECT_NE(out.find("PYTHONUNBUFFERED=1\n"), std::string::npos);
    EXPECT_EQ(out.find("EXEC_KERNEL_TEST_SECRET"), std::string::npos);
    EXPECT_NE(out.find("__init__.py\n"), std::string::npos);
    EXPECT_NE(out.find("sandbox_script.py\n"), std::string::npos);
    EXPECT_NE(out.find("# program for " + seen_dir), std::string::npos);
    EXPECT_TRUE(outcome.plot_files.empty());

    // Scratch directory is gone once the run returns
    EXPECT_FALSE(exists(seen_dir));
}

TEST(Sandbox, RunProgramPublishesPlots) {
    TempDir tools("exec_kernel-test-");
    TempDir output("exec_kernel-test-");
    std::string fake = tools.file("fake-python");
    FileUtils::write_file(fake,
        "#!/bin/sh\n"
        "echo png > \"$PYTHONPATH/plot_0.png\"\n"
        "echo png > \"$PYTHONPATH/plot_1.png\"\n");
    ASSERT_EQ(chmod(fake.c_str(), 0700), 0);

    RunnerOptions options;
    options.interpreter = fake;
    options.plot_output_dir = output.path();
    auto outcome = Sandbox::run_program([](const std::string&) { return std::string(); }, 10, options);

    ASSERT_EQ(outcome.plot_files.size(), 2u);
    EXPECT_EQ(outcome.plot_files[0], output.file("plot_0.png"));
    EXPECT_EQ(outcome.plot_files[1], output.file("plot_1.png"));
    EXPECT_TRUE(exists(output.file("plot_1.png")));
}
