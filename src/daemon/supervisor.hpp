#pragma once

#include "core/config.hpp"
#include "daemon/cancellation.hpp"
#include "daemon/circuit_breaker.hpp"
#include "daemon/process.hpp"
#include "daemon/startup_error.hpp"
#include "daemon/startup_race.hpp"
#include "daemon/stderr_log.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

enum class SupervisorState {
    Starting,
    Running,
    ExitedClean,
    ExitedCrash,
    Stopped,      // terminal: shutdown requested
    BreakerOpen,  // terminal: persistent failure
};

std::string to_string(SupervisorState state);

/// Keeps one instance of the service alive until shutdown or until the
/// circuit breaker opens.
class ProcessSupervisor {
public:
    /// `probe` defaults to a TCP connect against service.host:service.port
    ProcessSupervisor(const AppConfig& config, CancellationToken& token,
                      PortProbe probe = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /// Restart loop. Returns SupervisorState::Stopped after a graceful
    /// shutdown. Throws LaunchError when the command cannot be executed and
    /// CircuitBreakerOpenError when the breaker opens.
    SupervisorState run();

    /// Cancel the loop, SIGTERM the active child and wait (bounded) for run()
    /// to wind down. Safe to call from any thread, more than once.
    void shutdown();

    /// Supervise an already running, already reachable process before
    /// launching new ones. Must be called before run().
    void adopt(std::unique_ptr<ProcessHandle> process);

    SupervisorState state() const { return state_.load(); }

    /// Pid of the live child, -1 when none
    pid_t active_pid() const { return active_pid_.load(); }

    int launch_count() const { return launch_count_.load(); }

    const StartupErrorStore& errors() const { return errors_; }
    const StderrLog& stderr_log() const { return stderr_log_; }
    const CircuitBreaker& breaker() const { return breaker_; }

    /// Stderr tail reported the last time the service died before its port opened
    std::string early_exit_stderr() const;

private:
    const AppConfig& config_;
    CancellationToken& token_;
    StartupErrorStore errors_;
    StderrLog stderr_log_;
    PidFile pid_file_;
    CircuitBreaker breaker_;
    StartupRaceDetector race_;

    std::unique_ptr<ProcessHandle> adopted_;

    // Guards the cancelled-check + fork pair against shutdown()
    std::mutex launch_mutex_;
    std::atomic<pid_t> active_pid_{-1};
    std::atomic<SupervisorState> state_{SupervisorState::Starting};
    std::atomic<bool> running_{false};
    std::atomic<int> launch_count_{0};

    mutable std::mutex report_mutex_;
    std::string early_exit_stderr_;

    void remove_stale_locks() const;

    /// nullptr when shutdown was requested before the fork
    std::unique_ptr<ProcessHandle> launch();

    /// Block until the process exits, stopping it if cancelled meanwhile
    void wait_for_exit(ProcessHandle& process);

    void release(ProcessHandle& process);
    SupervisorState finish(SupervisorState state);
};
