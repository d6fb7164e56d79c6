#include "daemon/supervisor.hpp"
#include "core/errors.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <signal.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct FdCloser {
    int fd;
    ~FdCloser() { if (fd >= 0) close(fd); }
};

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

std::string describe_code(std::optional<int> code) {
    return code ? std::to_string(*code) : std::string("unknown");
}

StartupRaceDetector make_race(const AppConfig& config, PortProbe probe) {
    if (probe) {
        return StartupRaceDetector(std::move(probe), config.probe_interval_ms);
    }
    return StartupRaceDetector::for_tcp(config.service.host, config.service.port,
                                        config.probe_interval_ms);
}

} // namespace

std::string to_string(SupervisorState state) {
    switch (state) {
        case SupervisorState::Starting: return "starting";
        case SupervisorState::Running: return "running";
        case SupervisorState::ExitedClean: return "exited_clean";
        case SupervisorState::ExitedCrash: return "exited_crash";
        case SupervisorState::Stopped: return "stopped";
        case SupervisorState::BreakerOpen: return "breaker_open";
    }
    return "unknown";
}

ProcessSupervisor::ProcessSupervisor(const AppConfig& config, CancellationToken& token,
                                     PortProbe probe)
    : config_(config),
      token_(token),
      errors_(config.error_path),
      stderr_log_(config.stderr_log),
      pid_file_(config.service.pid_file),
      breaker_(config.breaker, errors_, stderr_log_, config.stderr_tail_lines),
      race_(make_race(config, std::move(probe))) {}

ProcessSupervisor::~ProcessSupervisor() {
    shutdown();
}

void ProcessSupervisor::adopt(std::unique_ptr<ProcessHandle> process) {
    adopted_ = std::move(process);
}

void ProcessSupervisor::remove_stale_locks() const {
    for (const auto& lock : config_.service.lock_files) {
        std::error_code ec;
        if (fs::remove(lock, ec)) {
            spdlog::debug("[supervisor] Removed stale lock {}", lock);
        } else if (ec) {
            spdlog::warn("[supervisor] Could not remove lock {}: {}", lock, ec.message());
        }
    }
}

std::unique_ptr<ProcessHandle> ProcessSupervisor::launch() {
    std::lock_guard<std::mutex> lock(launch_mutex_);
    if (token_.cancelled()) return nullptr;

    LaunchSpec spec;
    spec.command = config_.service.command;
    spec.env = config_.service.env;

    FdCloser stderr_fd{stderr_log_.open_for_append()};
    if (stderr_fd.fd < 0) {
        spdlog::warn("[supervisor] Cannot open {}, stderr will not be captured",
                     stderr_log_.path());
    }
    spec.stderr_fd = stderr_fd.fd;

    auto child = ChildProcess::launch(spec);

    active_pid_.store(child->pid());
    ++launch_count_;
    if (!pid_file_.write(child->pid())) {
        spdlog::warn("[supervisor] Could not write pid file {}", pid_file_.path());
    }
    spdlog::info("[supervisor] Started {} (pid {})", spec.command[0], child->pid());
    return child;
}

void ProcessSupervisor::wait_for_exit(ProcessHandle& process) {
    while (!process.poll_exit()) {
        if (token_.cancelled()) {
            spdlog::info("[supervisor] Stopping service (pid {})", process.pid());
            if (!process.stop(config_.shutdown_grace_ms)) {
                spdlog::error("[supervisor] Service (pid {}) did not exit after SIGKILL",
                              process.pid());
            }
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void ProcessSupervisor::release(ProcessHandle& process) {
    std::lock_guard<std::mutex> lock(launch_mutex_);
    if (active_pid_.load() == process.pid()) {
        active_pid_.store(-1);
    }
    pid_file_.remove();
}

SupervisorState ProcessSupervisor::finish(SupervisorState state) {
    state_.store(state);
    return state;
}

SupervisorState ProcessSupervisor::run() {
    struct RunningFlag {
        std::atomic<bool>& flag;
        explicit RunningFlag(std::atomic<bool>& f) : flag(f) { flag.store(true); }
        ~RunningFlag() { flag.store(false); }
    } running(running_);

    // Fresh supervision attempt: the previous verdict no longer applies
    errors_.clear();

    while (true) {
        std::unique_ptr<ProcessHandle> process;
        if (adopted_) {
            process = std::move(adopted_);
            std::lock_guard<std::mutex> lock(launch_mutex_);
            active_pid_.store(process->pid());
            spdlog::info("[supervisor] Supervising existing service (pid {})", process->pid());
        } else {
            remove_stale_locks();
            if (!stderr_log_.trim(config_.stderr_keep_lines)) {
                spdlog::warn("[supervisor] Could not trim {}", stderr_log_.path());
            }
            process = launch();
            if (!process) {
                spdlog::info("[supervisor] Shutdown requested, not starting");
                return finish(SupervisorState::Stopped);
            }
        }

        auto started = std::chrono::steady_clock::now();

        if (process->status() == ProcessStatus::Starting) {
            state_.store(SupervisorState::Starting);
            spdlog::info("[supervisor] Waiting for service on port {} (timeout {}ms)",
                         config_.service.port, config_.startup_timeout_ms);

            RaceOutcome outcome = race_.race(*process, config_.startup_timeout_ms);

            if (token_.cancelled()) {
                process->stop(config_.shutdown_grace_ms);
                release(*process);
                spdlog::info("[supervisor] Shutdown requested during startup, not restarting");
                return finish(SupervisorState::Stopped);
            }

            if (outcome.kind == RaceOutcome::Kind::TimedOut) {
                spdlog::warn("[supervisor] Service not reachable after {}ms, killing and restarting",
                             outcome.elapsed_ms);
                process->stop(config_.shutdown_grace_ms);
                release(*process);
                continue;
            }

            if (outcome.kind == RaceOutcome::Kind::Reachable) {
                spdlog::info("[supervisor] Service is reachable after {}ms", outcome.elapsed_ms);
            } else {
                try {
                    ensure_reachable(outcome, errors_, stderr_log_, config_.stderr_tail_lines);
                } catch (const ProcessExitError& e) {
                    spdlog::warn("[supervisor] Service exited before becoming reachable: {}",
                                 e.what());
                    if (e.artifact()) {
                        spdlog::warn("[supervisor] Startup error details: {}", *e.artifact());
                    }
                    std::lock_guard<std::mutex> lock(report_mutex_);
                    early_exit_stderr_ = e.stderr_tail();
                }
            }
        }

        if (process->status() == ProcessStatus::Running) {
            state_.store(SupervisorState::Running);
            wait_for_exit(*process);
        }
        release(*process);

        int64_t uptime_ms = ms_since(started);

        if (token_.cancelled()) {
            spdlog::info("[supervisor] Shutdown requested, not restarting");
            return finish(SupervisorState::Stopped);
        }

        auto code = process->exit_code();
        state_.store(code && *code == 0 ? SupervisorState::ExitedClean
                                        : SupervisorState::ExitedCrash);
        spdlog::warn("[supervisor] Service exited (code={}, uptime={}ms)",
                     describe_code(code), uptime_ms);

        if (breaker_.record_exit(uptime_ms, epoch_ms(), code) == BreakerVerdict::Open) {
            finish(SupervisorState::BreakerOpen);
            throw CircuitBreakerOpenError(
                "Service crashed " + std::to_string(breaker_.window().count) +
                    " times within " + std::to_string(config_.breaker.window_ms) + "ms",
                breaker_.window().count);
        }

        spdlog::info("[supervisor] Restarting in {}ms", config_.breaker.restart_delay_ms);
        if (!token_.sleep_for(config_.breaker.restart_delay_ms)) {
            spdlog::info("[supervisor] Shutdown requested, not restarting");
            return finish(SupervisorState::Stopped);
        }
    }
}

std::string ProcessSupervisor::early_exit_stderr() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return early_exit_stderr_;
}

void ProcessSupervisor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(launch_mutex_);
        token_.cancel();
        pid_t pid = active_pid_.load();
        if (pid > 0) {
            spdlog::info("[supervisor] Shutdown requested, sending SIGTERM to pid {}", pid);
            if (::kill(-pid, SIGTERM) != 0) {
                ::kill(pid, SIGTERM);
            }
        }
    }

    // run() escalates to SIGKILL after the grace period; allow for both waits
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(2 * config_.shutdown_grace_ms + 1000);
    while (running_.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}
