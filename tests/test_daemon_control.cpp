#include <gtest/gtest.h>

#include "centy/daemon_control.hpp"
#include "testing.hpp"

#include <chrono>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

namespace centy {

namespace {

constexpr const char* kNoSuchProcess = "centy-test-no-such-process";

DaemonControl::Options TestOptions(const std::string& pid_file) {
    return DaemonControl::Options{
        .pid_file = pid_file,
        .process_name = kNoSuchProcess,
        .poll_interval = 50ms,
        .graceful_polls = 40,
    };
}

} // namespace

TEST(DaemonControlTest, PidFileOfLiveProcessIsUsed) {
    testutil::TemporaryDirectory tmp;
    const std::string pid_file = tmp.Path() + "/daemon.pid";
    testutil::WriteFile(pid_file, std::to_string(::getpid()) + "\n");

    DaemonControl dc(TestOptions(pid_file));
    EXPECT_EQ(dc.FindRunningPid(), ::getpid());
}

TEST(DaemonControlTest, GarbagePidFileIsIgnored) {
    testutil::TemporaryDirectory tmp;
    const std::string pid_file = tmp.Path() + "/daemon.pid";
    testutil::WriteFile(pid_file, "not-a-pid");

    DaemonControl dc(TestOptions(pid_file));
    EXPECT_FALSE(dc.FindRunningPid().has_value());
}

TEST(DaemonControlTest, NonPositivePidIsNeverSignalled) {
    testutil::TemporaryDirectory tmp;
    const std::string pid_file = tmp.Path() + "/daemon.pid";
    testutil::WriteFile(pid_file, "0");

    DaemonControl dc(TestOptions(pid_file));
    EXPECT_FALSE(dc.FindRunningPid().has_value());
    EXPECT_FALSE(IsProcessRunning(0));
    EXPECT_FALSE(IsProcessRunning(-1));
}

TEST(DaemonControlTest, NothingRunningMeansNoRestart) {
    testutil::TemporaryDirectory tmp;
    DaemonControl dc(TestOptions(tmp.Path() + "/missing.pid"));

    auto restarted = dc.RestartIfRunning("/nonexistent/centy-daemon");
    ASSERT_TRUE(restarted.has_value()) << restarted.error();
    EXPECT_FALSE(*restarted);
}

TEST(DaemonControlTest, StartReportsExecFailure) {
    testutil::TemporaryDirectory tmp;
    DaemonControl dc(TestOptions(""));

    auto r = dc.Start(tmp.Path() + "/does-not-exist");
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("failed to start daemon"), std::string::npos);
}

TEST(DaemonControlTest, StartLaunchesExecutable) {
    DaemonControl dc(TestOptions(""));
    EXPECT_TRUE(dc.Start("/bin/true").is_ok());
}

TEST(DaemonControlTest, StopTerminatesProcess) {
    const pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        ::execlp("sleep", "sleep", "30", static_cast<char*>(nullptr));
        ::_exit(127);
    }
    // Reap the child so it does not linger as a zombie that still answers kill(pid, 0).
    std::thread reaper([child] {
        int status = 0;
        (void)::waitpid(child, &status, 0);
    });

    DaemonControl dc(TestOptions(""));
    auto r = dc.Stop(child);
    reaper.join();
    EXPECT_TRUE(r.is_ok()) << r.msg;
}

TEST(DaemonControlTest, OptionsForHome) {
    const auto opt = DaemonOptionsFor("/home/dev", "centy-daemon");
    EXPECT_EQ(opt.pid_file, std::filesystem::path("/home/dev/.centy/daemon.pid"));
    EXPECT_EQ(opt.process_name, "centy-daemon");
}

} // namespace centy
