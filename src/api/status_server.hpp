#pragma once

#include "core/config.hpp"
#include "daemon/startup_race.hpp"

#include <nlohmann/json_fwd.hpp>

#include <functional>
#include <memory>
#include <string>
#include <sys/types.h>

class StartupErrorStore;

/// Read-only HTTP view of the supervisor:
///   GET /sandbox-health  liveness of gatewarden itself
///   GET /api/status      not_running | running | not_responding | startup_failed
class StatusServer {
public:
    /// `active_pid` reports the live service pid or -1. `probe` defaults to a
    /// TCP connect against service.host:service.port.
    StatusServer(const AppConfig& config,
                 const StartupErrorStore& errors,
                 std::function<pid_t()> active_pid,
                 PortProbe probe = {});
    ~StatusServer();

    /// Bind and serve on a background thread. Port 0 picks a free port.
    bool start(const std::string& host, int port);

    void stop();

    /// Bound port, 0 when not started
    int port() const;

    /// Body of GET /api/status
    nlohmann::json status() const;

    /// Body of GET /sandbox-health
    nlohmann::json health() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
