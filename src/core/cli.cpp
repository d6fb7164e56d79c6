#include "core/cli.hpp"
#include "core/config.hpp"
#include "daemon/daemon.hpp"
#include "daemon/process.hpp"
#include "daemon/startup_error.hpp"
#include "api/status_server.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    // No subcommand, or only options → supervise
    if (argc < 2 || std::strcmp(argv[1], "--config") == 0) {
        return -2;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "run") == 0 || std::strcmp(cmd, "daemon") == 0) {
        return -2;  // special: caller handles supervisor mode
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status(argc, argv);
    }
    if (std::strcmp(cmd, "reconcile") == 0) {
        return cmd_reconcile(argc, argv);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'gatewarden help' for usage.\n";
    return 1;
}

std::string CLI::config_arg(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            return argv[i + 1];
        }
    }
    return "";
}

void CLI::load_config(Config& config, int argc, char* argv[]) {
    std::string path = config_arg(argc, argv);
    bool loaded = path.empty() ? config.load() : config.load_from(path);
    if (!loaded && !path.empty()) {
        std::cerr << "Could not load " << path << ", using defaults\n";
    }
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "gatewarden: crash-aware supervisor for a single network service\n"
        "\n"
        "Usage:\n"
        "  gatewarden [run] [--config P]   Reconcile jobs, then supervise the service\n"
        "  gatewarden reconcile [--config P]  Merge declared jobs into the runtime job file\n"
        "  gatewarden status [--config P]  Print service status as JSON\n"
        "  gatewarden version              Show version\n"
        "  gatewarden help                 Show this help\n"
        "\n"
        "Config is read from --config, else /etc/gatewarden/config.yaml (root)\n"
        "or ~/.config/gatewarden/config.yaml.\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "gatewarden " << APP_VERSION << "\n";
    return 0;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status(int argc, char* argv[]) {
    Config config;
    load_config(config, argc, argv);
    const AppConfig& d = config.data();

    StartupErrorStore errors(d.error_path);
    PidFile pid_file(d.service.pid_file);
    StatusServer reporter(d, errors, [&pid_file] {
        return pid_file.live_pid().value_or(-1);
    });

    auto status = reporter.status();
    std::cout << status.dump(2) << "\n";
    return status.value("ok", false) ? 0 : 1;
}

// ── reconcile ───────────────────────────────────────────────

int CLI::cmd_reconcile(int argc, char* argv[]) {
    Config config;
    load_config(config, argc, argv);
    return Daemon::reconcile_jobs(config.data()) ? 0 : 1;
}
