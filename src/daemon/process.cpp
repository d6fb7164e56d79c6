#include "daemon/process.hpp"
#include "core/errors.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

// ── ProcessHandle ───────────────────────────────────────────

void ProcessHandle::mark_running() {
    if (status_ == ProcessStatus::Starting) {
        status_ = ProcessStatus::Running;
    }
}

void ProcessHandle::mark_exited(std::optional<int> code) {
    status_ = ProcessStatus::Exited;
    exit_code_ = code;
}

bool ProcessHandle::wait_exit(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!poll_exit()) {
        if (timeout_ms >= 0 && std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return true;
}

bool ProcessHandle::stop(int grace_ms) {
    if (poll_exit()) return true;

    // Send SIGTERM first
    if (signal(SIGTERM) && wait_exit(grace_ms)) {
        return true;
    }

    // Force kill if still running
    signal(SIGKILL);
    return wait_exit(grace_ms);
}

// ── ChildProcess ────────────────────────────────────────────

std::unique_ptr<ChildProcess> ChildProcess::launch(const LaunchSpec& spec) {
    if (spec.command.empty() || spec.command[0].empty()) {
        throw LaunchError("No launch command configured");
    }

    // Reports exec failure back to the parent; closes itself on successful exec
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        throw LaunchError(std::string("pipe2 failed: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        throw LaunchError(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process
        close(status_pipe[0]);
        setpgid(0, 0);

        // Signal mask and dispositions survive exec; hand the service a clean slate
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::signal(SIGTERM, SIG_DFL);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGPIPE, SIG_DFL);

        if (spec.stderr_fd >= 0) {
            dup2(spec.stderr_fd, STDERR_FILENO);
        }
        for (const auto& kv : spec.env) {
            setenv(kv.first.c_str(), kv.second.c_str(), 1);
        }

        // Build argv array for execvp
        std::vector<const char*> argv;
        for (const auto& arg : spec.command) {
            argv.push_back(arg.c_str());
        }
        argv.push_back(nullptr);

        // Replace child process with target binary
        execvp(argv[0], const_cast<char* const*>(argv.data()));

        // If execvp returns, it failed
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status;
        waitpid(pid, &status, 0);
        throw LaunchError("Cannot execute '" + spec.command[0] + "': " +
                          std::strerror(child_errno));
    }

    return std::make_unique<ChildProcess>(LaunchTag{}, pid);
}

ChildProcess::~ChildProcess() {
    if (status() != ProcessStatus::Exited) {
        signal(SIGKILL);
        int status;
        waitpid(pid(), &status, 0);
    }
}

bool ChildProcess::poll_exit() {
    if (status() == ProcessStatus::Exited) return true;

    int status;
    pid_t result = waitpid(pid(), &status, WNOHANG);
    if (result == 0) return false;

    if (result < 0) {
        // Reaped elsewhere; the code is lost
        mark_exited(std::nullopt);
        return true;
    }

    if (WIFEXITED(status)) {
        mark_exited(WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
        // Shell convention for death by signal
        mark_exited(128 + WTERMSIG(status));
    } else {
        mark_exited(std::nullopt);
    }
    return true;
}

bool ChildProcess::signal(int sig) {
    if (status() == ProcessStatus::Exited) return false;
    // The child leads its own process group; reach its descendants too
    if (::kill(-pid(), sig) == 0) return true;
    return ::kill(pid(), sig) == 0;
}

// ── AttachedProcess ─────────────────────────────────────────

bool AttachedProcess::poll_exit() {
    if (status() == ProcessStatus::Exited) return true;
    if (process_alive(pid())) return false;
    mark_exited(std::nullopt);
    return true;
}

bool AttachedProcess::signal(int sig) {
    if (status() == ProcessStatus::Exited) return false;
    return ::kill(pid(), sig) == 0;
}

// ── PidFile ─────────────────────────────────────────────────

bool process_alive(pid_t pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

std::vector<std::string> process_command_line(pid_t pid) {
    std::vector<std::string> argv;
    std::ifstream in("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
    if (!in.is_open()) return argv;

    std::string arg;
    while (std::getline(in, arg, '\0')) {
        argv.push_back(arg);
    }
    return argv;
}

PidFile::PidFile(std::string path) : path_(std::move(path)) {}

bool PidFile::write(pid_t pid) const {
    if (path_.empty()) return false;
    std::error_code ec;
    fs::path p(path_);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
    }
    std::ofstream out(path_, std::ios::trunc);
    if (!out.is_open()) return false;
    out << pid << "\n";
    return static_cast<bool>(out);
}

std::optional<pid_t> PidFile::read() const {
    std::ifstream in(path_);
    if (!in.is_open()) return std::nullopt;
    long pid = 0;
    if (!(in >> pid) || pid <= 0) return std::nullopt;
    return static_cast<pid_t>(pid);
}

bool PidFile::remove() const {
    std::error_code ec;
    fs::remove(path_, ec);
    return !ec;
}

std::optional<pid_t> PidFile::live_pid() const {
    auto pid = read();
    if (!pid || !process_alive(*pid)) return std::nullopt;
    return pid;
}
