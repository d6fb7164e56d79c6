#include <gtest/gtest.h>
#include "daemon/process.hpp"
#include "core/errors.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

LaunchSpec spec_for(std::vector<std::string> command) {
    LaunchSpec spec;
    spec.command = std::move(command);
    return spec;
}

} // namespace

// ── ChildProcess ────────────────────────────────────────────

TEST(ChildProcessTest, LaunchSleep) {
    auto child = ChildProcess::launch(spec_for({"/bin/sleep", "60"}));
    ASSERT_NE(child, nullptr);
    EXPECT_GT(child->pid(), 0);
    EXPECT_EQ(child->status(), ProcessStatus::Starting);
    EXPECT_FALSE(child->poll_exit());
    EXPECT_TRUE(process_alive(child->pid()));

    EXPECT_TRUE(child->stop(2000));
    EXPECT_EQ(child->status(), ProcessStatus::Exited);
}

TEST(ChildProcessTest, StopReportsSignalExitCode) {
    auto child = ChildProcess::launch(spec_for({"/bin/sleep", "60"}));
    ASSERT_TRUE(child->stop(2000));
    ASSERT_TRUE(child->exit_code().has_value());
    EXPECT_EQ(*child->exit_code(), 128 + SIGTERM);
}

TEST(ChildProcessTest, TermReachesChildOfMaskedSupervisor) {
    // Same mask the daemon's signal thread relies on
    sigset_t set, old;
    sigemptyset(&set);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGINT);
    ASSERT_EQ(pthread_sigmask(SIG_BLOCK, &set, &old), 0);

    auto child = ChildProcess::launch(spec_for({"/bin/sleep", "60"}));
    bool stopped = child->stop(5000);
    pthread_sigmask(SIG_SETMASK, &old, nullptr);

    ASSERT_TRUE(stopped);
    ASSERT_TRUE(child->exit_code().has_value());
    EXPECT_EQ(*child->exit_code(), 128 + SIGTERM);
}

TEST(ChildProcessTest, ExitCodeCollected) {
    auto child = ChildProcess::launch(spec_for({"/bin/false"}));
    ASSERT_TRUE(child->wait_exit(5000));
    ASSERT_TRUE(child->exit_code().has_value());
    EXPECT_EQ(*child->exit_code(), 1);
}

TEST(ChildProcessTest, PathLookup) {
    auto child = ChildProcess::launch(spec_for({"true"}));
    ASSERT_TRUE(child->wait_exit(5000));
    EXPECT_EQ(child->exit_code(), 0);
}

TEST(ChildProcessTest, InvalidBinaryThrowsLaunchError) {
    // exec failure is reported through the status pipe
    EXPECT_THROW(ChildProcess::launch(spec_for({"/nonexistent/binary"})), LaunchError);
}

TEST(ChildProcessTest, EmptyCommandThrowsLaunchError) {
    EXPECT_THROW(ChildProcess::launch(spec_for({})), LaunchError);
}

TEST(ChildProcessTest, EnvironmentIsPassedThrough) {
    LaunchSpec spec = spec_for({"/bin/sh", "-c", "exit $GATEWARDEN_TEST_CODE"});
    spec.env["GATEWARDEN_TEST_CODE"] = "7";
    auto child = ChildProcess::launch(spec);
    ASSERT_TRUE(child->wait_exit(5000));
    EXPECT_EQ(child->exit_code(), 7);
}

TEST(ChildProcessTest, StderrRedirected) {
    std::string path = (fs::temp_directory_path() /
                        ("gatewarden-test-child-stderr-" + std::to_string(getpid()))).string();
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    ASSERT_GE(fd, 0);

    LaunchSpec spec = spec_for({"/bin/sh", "-c", "echo 'fatal: bad token' >&2; exit 3"});
    spec.stderr_fd = fd;
    auto child = ChildProcess::launch(spec);
    close(fd);
    ASSERT_TRUE(child->wait_exit(5000));

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "fatal: bad token\n");
    fs::remove(path);
}

TEST(ChildProcessTest, DoubleStop) {
    auto child = ChildProcess::launch(spec_for({"/bin/sleep", "60"}));
    EXPECT_TRUE(child->stop(2000));
    EXPECT_TRUE(child->stop(2000));  // should not crash
    EXPECT_FALSE(child->signal(SIGTERM));
}

TEST(ChildProcessTest, MarkRunningOnlyFromStarting) {
    auto child = ChildProcess::launch(spec_for({"/bin/true"}));
    ASSERT_TRUE(child->wait_exit(5000));
    child->mark_running();
    EXPECT_EQ(child->status(), ProcessStatus::Exited);
}

// ── AttachedProcess ─────────────────────────────────────────

TEST(AttachedProcessTest, TracksForeignPid) {
    auto child = ChildProcess::launch(spec_for({"/bin/sleep", "60"}));
    AttachedProcess attached(child->pid());
    EXPECT_FALSE(attached.poll_exit());

    // Reaped by its real parent; the attached view sees it vanish
    ASSERT_TRUE(child->stop(2000));
    EXPECT_TRUE(attached.poll_exit());
    EXPECT_FALSE(attached.exit_code().has_value());
}

TEST(AttachedProcessTest, DeadPidHasExited) {
    auto child = ChildProcess::launch(spec_for({"/bin/true"}));
    ASSERT_TRUE(child->wait_exit(5000));
    AttachedProcess attached(child->pid());
    EXPECT_TRUE(attached.poll_exit());
}

// ── PidFile ─────────────────────────────────────────────────

class PidFileTest : public ::testing::Test {
protected:
    std::string path;

    void SetUp() override {
        path = (fs::temp_directory_path() /
                ("gatewarden-test-pid-" + std::to_string(getpid())) / "service.pid").string();
    }

    void TearDown() override {
        fs::remove_all(fs::path(path).parent_path());
    }
};

TEST_F(PidFileTest, WriteReadRemove) {
    PidFile pid_file(path);
    EXPECT_FALSE(pid_file.read().has_value());

    ASSERT_TRUE(pid_file.write(4242));
    EXPECT_EQ(pid_file.read(), 4242);

    EXPECT_TRUE(pid_file.remove());
    EXPECT_FALSE(fs::exists(path));
    EXPECT_TRUE(pid_file.remove());
}

TEST_F(PidFileTest, GarbageIsIgnored) {
    fs::create_directories(fs::path(path).parent_path());
    {
        std::ofstream out(path);
        out << "not-a-pid\n";
    }
    EXPECT_FALSE(PidFile(path).read().has_value());
}

TEST_F(PidFileTest, LivePidOnlyForRunningProcess) {
    PidFile pid_file(path);
    ASSERT_TRUE(pid_file.write(getpid()));
    EXPECT_EQ(pid_file.live_pid(), getpid());

    auto child = ChildProcess::launch(spec_for({"/bin/true"}));
    ASSERT_TRUE(child->wait_exit(5000));
    ASSERT_TRUE(pid_file.write(child->pid()));
    EXPECT_FALSE(pid_file.live_pid().has_value());
}

TEST(ProcessCommandLineTest, ReadsProcCmdline) {
    auto child = ChildProcess::launch(spec_for({"/bin/sleep", "60"}));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto argv = process_command_line(child->pid());
    ASSERT_EQ(argv.size(), 2u);
    EXPECT_EQ(argv[0], "/bin/sleep");
    EXPECT_EQ(argv[1], "60");
    child->stop(2000);
}

TEST(ProcessCommandLineTest, UnknownPidIsEmpty) {
    EXPECT_TRUE(process_command_line(-1).empty());
}
