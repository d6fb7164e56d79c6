#pragma once

#include "core/config.hpp"
#include "daemon/cancellation.hpp"
#include "daemon/startup_race.hpp"
#include "daemon/supervisor.hpp"
#include "api/status_server.hpp"

#include <memory>

class Daemon {
public:
    /// `probe` replaces the TCP reachability check (tests)
    explicit Daemon(Config& config, PortProbe probe = {});
    ~Daemon();

    /// Boot sequence; blocks until shutdown or a terminal failure.
    /// Returns the process exit status.
    int run();

    /// Request graceful stop. Thread-safe, not async-signal-safe.
    void request_stop();

    /// Merge the declared job list into the runtime job file.
    /// Returns false when reconciliation was skipped because of bad input.
    static bool reconcile_jobs(const AppConfig& config);

    /// Validate the service config file. Writes a config_invalid_json
    /// artifact and returns false when it does not parse.
    static bool preflight(const AppConfig& config);

    const ProcessSupervisor& supervisor() const { return supervisor_; }

private:
    Config& config_;
    PortProbe probe_;
    CancellationToken token_;
    ProcessSupervisor supervisor_;
    std::unique_ptr<StatusServer> status_;

    /// Pick up a service left running by a previous gatewarden instance
    void try_reattach();

    /// Keep answering status queries after a terminal failure until stopped
    void hold_for_status();
};
