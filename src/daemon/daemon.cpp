#include "daemon/daemon.hpp"
#include "core/errors.hpp"
#include "core/job_store.hpp"
#include "core/reconciler.hpp"
#include "daemon/process.hpp"
#include "daemon/startup_error.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool same_program(const std::vector<std::string>& argv, const std::vector<std::string>& command) {
    if (argv.empty() || command.empty()) return false;
    return fs::path(argv[0]).filename() == fs::path(command[0]).filename();
}

} // namespace

Daemon::Daemon(Config& config, PortProbe probe)
    : config_(config),
      probe_(probe),
      supervisor_(config.data(), token_, probe) {}

Daemon::~Daemon() {
    request_stop();
    if (status_) status_->stop();
}

bool Daemon::reconcile_jobs(const AppConfig& config) {
    JobStore store(config.declared_jobs_path, config.declared_jobs_fallback_path,
                   config.runtime_jobs_path);

    std::optional<std::vector<DeclaredJob>> declared;
    try {
        declared = store.load_declared();
        if (declared) validate_declared(*declared);
    } catch (const MalformedStateError& e) {
        spdlog::error("[reconcile] Declared job list rejected, runtime jobs left untouched: {}",
                      e.what());
        return false;
    }

    if (!declared) {
        spdlog::info("[reconcile] No declared job list found, skipping");
        return true;
    }

    spdlog::info("[reconcile] Reconciling declared jobs from {}", store.declared_source());
    RuntimeJobFile runtime = store.load_runtime();
    ReconcileResult result = reconcile(*declared, runtime.jobs, epoch_ms());

    if (!store.save_runtime(result.jobs, runtime)) {
        spdlog::error("[reconcile] Failed to write {}", store.runtime_path());
        return false;
    }

    spdlog::info("[reconcile] {} jobs ({} updated, {} new, {} unmanaged)",
                 result.jobs.size(), result.updated, result.added, result.unmanaged);
    return true;
}

bool Daemon::preflight(const AppConfig& config) {
    const std::string& path = config.service.config_path;
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) return true;

    spdlog::info("Validating service config {}", path);
    std::ifstream in(path);
    try {
        json parsed = json::parse(in);
        (void)parsed;
    } catch (const json::parse_error& e) {
        spdlog::error("FATAL: service config {} is not valid JSON: {}", path, e.what());

        StartupErrorArtifact artifact;
        artifact.kind = StartupErrorKind::ConfigInvalidJson;
        artifact.message = "Service config " + path +
                           " is not valid JSON. The file may have been corrupted during patching.";
        artifact.timestamp = iso_timestamp_now();
        if (!StartupErrorStore(config.error_path).write(artifact)) {
            spdlog::error("Could not write startup error artifact {}", config.error_path);
        }
        return false;
    }
    spdlog::info("Service config validation passed");
    return true;
}

void Daemon::try_reattach() {
    const AppConfig& cfg = config_.data();
    PidFile pid_file(cfg.service.pid_file);

    auto pid = pid_file.live_pid();
    if (!pid) {
        pid_file.remove();
        return;
    }
    if (!same_program(process_command_line(*pid), cfg.service.command)) {
        spdlog::info("[supervisor] Pid file {} points at an unrelated process, ignoring",
                     pid_file.path());
        pid_file.remove();
        return;
    }

    spdlog::info("[supervisor] Found existing service process {}", *pid);
    auto existing = std::make_unique<AttachedProcess>(*pid);

    StartupRaceDetector race = probe_
        ? StartupRaceDetector(probe_, cfg.probe_interval_ms)
        : StartupRaceDetector::for_tcp(cfg.service.host, cfg.service.port, cfg.probe_interval_ms);

    RaceOutcome outcome = race.race(*existing, cfg.startup_timeout_ms);
    try {
        ensure_reachable(outcome, supervisor_.errors(), supervisor_.stderr_log(),
                         cfg.stderr_tail_lines);
        spdlog::info("[supervisor] Existing service is reachable");
        supervisor_.adopt(std::move(existing));
    } catch (const ProcessExitError& e) {
        spdlog::error("[supervisor] Existing service exited: {}", e.what());
        if (e.artifact()) {
            spdlog::error("[supervisor] Startup error details: {}", *e.artifact());
        }
        pid_file.remove();
    } catch (const TimeoutError& e) {
        spdlog::warn("[supervisor] Existing service not reachable ({}), killing and restarting",
                     e.what());
        existing->stop(cfg.shutdown_grace_ms);
        pid_file.remove();
    }
}

void Daemon::hold_for_status() {
    if (!status_) return;
    spdlog::info("[status] Supervision ended; still serving status until shutdown");
    while (!token_.cancelled()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void Daemon::request_stop() {
    supervisor_.shutdown();
}

int Daemon::run() {
    const AppConfig& cfg = config_.data();

    // 1. Reconcile scheduled jobs before the service reads them
    if (!reconcile_jobs(cfg)) {
        spdlog::warn("[reconcile] Continuing with the existing runtime job list");
    }

    // 2. Refuse to start on a corrupted service config
    if (!preflight(cfg)) {
        return 1;
    }

    // 3. Status endpoint
    if (cfg.status_port > 0) {
        status_ = std::make_unique<StatusServer>(
            cfg, supervisor_.errors(), [this] { return supervisor_.active_pid(); }, probe_);
        if (!status_->start(cfg.status_host, cfg.status_port)) {
            spdlog::warn("[status] Status endpoint disabled");
            status_.reset();
        }
    }

    // 4. Previous instance may have left the service running
    try_reattach();

    // 5. Supervise until shutdown or terminal failure
    int rc = 0;
    try {
        supervisor_.run();
        spdlog::info("[supervisor] Stopped");
    } catch (const CircuitBreakerOpenError& e) {
        spdlog::error("[supervisor] {}", e.what());
        rc = 1;
        hold_for_status();
    } catch (const LaunchError& e) {
        spdlog::error("[supervisor] Launch failed: {}", e.what());

        StartupErrorArtifact artifact;
        artifact.kind = StartupErrorKind::LaunchFailed;
        artifact.message = e.what();
        artifact.timestamp = iso_timestamp_now();
        if (!supervisor_.errors().write(artifact)) {
            spdlog::error("Could not write startup error artifact {}", supervisor_.errors().path());
        }
        rc = 1;
        hold_for_status();
    }

    // 6. Cleanup
    if (status_) {
        status_->stop();
    }
    return rc;
}
