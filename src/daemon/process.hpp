#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

enum class ProcessStatus { Starting, Running, Exited };

/// A supervised process, either launched by us or discovered running.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    pid_t pid() const { return pid_; }
    ProcessStatus status() const { return status_; }

    /// Present only once exited, and only when the status could be collected
    std::optional<int> exit_code() const { return exit_code_; }

    /// Called once the service is known to be reachable
    void mark_running();

    /// Non-blocking exit check. Returns true once the process has exited.
    virtual bool poll_exit() = 0;

    /// Deliver a signal to the process
    virtual bool signal(int sig) = 0;

    /// Poll until exit or `timeout_ms` elapses (negative waits forever)
    bool wait_exit(int timeout_ms);

    /// SIGTERM, wait up to `grace_ms`, then SIGKILL
    bool stop(int grace_ms);

protected:
    explicit ProcessHandle(pid_t pid) : pid_(pid) {}

    void mark_exited(std::optional<int> code);

private:
    pid_t pid_;
    ProcessStatus status_ = ProcessStatus::Starting;
    std::optional<int> exit_code_;
};

struct LaunchSpec {
    std::vector<std::string> command;           // argv, [0] looked up in PATH
    std::map<std::string, std::string> env;     // added to the inherited environment
    int stderr_fd = -1;                          // child stderr target, -1 to inherit
};

/// Process forked by this supervisor. Exit status is collected with waitpid.
class ChildProcess : public ProcessHandle {
    struct LaunchTag { explicit LaunchTag() = default; };

public:
    /// fork + exec. Throws LaunchError when the command cannot be executed;
    /// exec failure is reported synchronously through a close-on-exec pipe.
    static std::unique_ptr<ChildProcess> launch(const LaunchSpec& spec);

    /// Only reachable through launch()
    ChildProcess(LaunchTag, pid_t pid) : ProcessHandle(pid) {}
    ~ChildProcess() override;

    bool poll_exit() override;
    bool signal(int sig) override;
};

/// Process left running by a previous supervisor instance. Liveness is
/// checked with kill(pid, 0); its exit code cannot be collected.
class AttachedProcess : public ProcessHandle {
public:
    explicit AttachedProcess(pid_t pid) : ProcessHandle(pid) {}

    bool poll_exit() override;
    bool signal(int sig) override;
};

/// Records the pid of the current child so a restarted supervisor can re-attach.
class PidFile {
public:
    explicit PidFile(std::string path);

    bool write(pid_t pid) const;
    std::optional<pid_t> read() const;
    bool remove() const;

    /// Pid from the file if that process is still alive
    std::optional<pid_t> live_pid() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

bool process_alive(pid_t pid);

/// argv of a running process from /proc, empty if unavailable
std::vector<std::string> process_command_line(pid_t pid);
