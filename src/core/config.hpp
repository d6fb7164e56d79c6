#pragma once

#include <map>
#include <string>
#include <vector>

struct ServiceSettings {
    // Launch command, argv[0] resolved through PATH
    std::vector<std::string> command = {
        "openclaw", "gateway", "--port", "18789", "--allow-unconfigured", "--bind", "lan"
    };
    std::map<std::string, std::string> env;  // added to the inherited environment
    std::string host = "127.0.0.1";
    int port = 18789;
    std::string config_path;  // service config validated before launch, optional
    std::string pid_file = "/tmp/gatewarden-gateway.pid";
    std::vector<std::string> lock_files = {"/tmp/openclaw-gateway.lock"};
};

struct BreakerSettings {
    int window_ms = 30000;
    int max_crashes = 3;
    int restart_delay_ms = 5000;
};

struct AppConfig {
    ServiceSettings service;
    BreakerSettings breaker;

    // Startup race
    int startup_timeout_ms = 180000;
    int probe_interval_ms = 250;

    // Shutdown
    int shutdown_grace_ms = 5000;

    // Artifacts
    std::string error_path = "/tmp/gateway-startup-error";
    std::string stderr_log = "/tmp/gateway-stderr.log";
    int stderr_tail_lines = 50;
    int stderr_keep_lines = 1000;

    // Scheduled jobs
    std::string declared_jobs_path = "/usr/local/etc/openclaw-base/openclaw/cron/jobs.json";
    std::string declared_jobs_fallback_path = "/usr/local/etc/openclaw-base/jobs.json";
    std::string runtime_jobs_path;

    // Status endpoint (disabled when port is 0)
    std::string status_host = "0.0.0.0";
    int status_port = 0;

    // Logging
    std::string log_level = "info";
};

class Config {
public:
    Config();
    ~Config();

    /// Load from the default location
    bool load();

    /// Load from an explicit file. Returns false and keeps defaults when the
    /// file is missing or malformed.
    bool load_from(const std::string& path);

    AppConfig& data();
    const AppConfig& data() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string default_runtime_jobs_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
