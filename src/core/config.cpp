#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

int at_least(int value, int floor, const char* key) {
    if (value >= floor) return value;
    spdlog::warn("[config] {} = {} is out of range, using {}", key, value, floor);
    return floor;
}

} // namespace

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() {
    config_.runtime_jobs_path = default_runtime_jobs_path();
}

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/gatewarden";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/gatewarden";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::default_runtime_jobs_path() {
    return expand_home("~/.openclaw/cron/jobs.json");
}

bool Config::load() {
    return load_from(config_path());
}

bool Config::load_from(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    // Parse into a copy so a half-read file leaves the defaults intact
    AppConfig cfg = config_;

    try {
        YAML::Node root = YAML::LoadFile(path);

        // Service section
        if (auto service = root["service"]) {
            if (auto cmd = service["command"]) {
                cfg.service.command.clear();
                for (const auto& arg : cmd) {
                    cfg.service.command.push_back(arg.as<std::string>());
                }
            }
            if (auto env = service["env"]) {
                for (const auto& kv : env) {
                    cfg.service.env[kv.first.as<std::string>()] = kv.second.as<std::string>("");
                }
            }
            cfg.service.host = service["host"].as<std::string>(cfg.service.host);
            cfg.service.port = service["port"].as<int>(cfg.service.port);
            cfg.service.config_path = expand_home(
                service["config_path"].as<std::string>(cfg.service.config_path));
            cfg.service.pid_file = expand_home(
                service["pid_file"].as<std::string>(cfg.service.pid_file));
            if (auto locks = service["lock_files"]) {
                cfg.service.lock_files.clear();
                for (const auto& lock : locks) {
                    cfg.service.lock_files.push_back(expand_home(lock.as<std::string>()));
                }
            }
        }

        // Breaker section
        if (auto breaker = root["breaker"]) {
            cfg.breaker.window_ms = breaker["window_ms"].as<int>(cfg.breaker.window_ms);
            cfg.breaker.max_crashes = breaker["max_crashes"].as<int>(cfg.breaker.max_crashes);
            cfg.breaker.restart_delay_ms =
                breaker["restart_delay_ms"].as<int>(cfg.breaker.restart_delay_ms);

            // A zero window never counts a crash; zero max opens on the first one
            cfg.breaker.window_ms = at_least(cfg.breaker.window_ms, 1, "breaker.window_ms");
            cfg.breaker.max_crashes = at_least(cfg.breaker.max_crashes, 1, "breaker.max_crashes");
            cfg.breaker.restart_delay_ms =
                at_least(cfg.breaker.restart_delay_ms, 0, "breaker.restart_delay_ms");
        }

        // Startup section
        if (auto startup = root["startup"]) {
            cfg.startup_timeout_ms = startup["timeout_ms"].as<int>(cfg.startup_timeout_ms);
            cfg.probe_interval_ms = startup["probe_interval_ms"].as<int>(cfg.probe_interval_ms);
        }

        // Shutdown section
        if (auto shutdown = root["shutdown"]) {
            cfg.shutdown_grace_ms = shutdown["grace_ms"].as<int>(cfg.shutdown_grace_ms);
        }

        // Artifacts section
        if (auto artifacts = root["artifacts"]) {
            cfg.error_path = expand_home(artifacts["error_path"].as<std::string>(cfg.error_path));
            cfg.stderr_log = expand_home(artifacts["stderr_log"].as<std::string>(cfg.stderr_log));
            cfg.stderr_tail_lines =
                artifacts["stderr_tail_lines"].as<int>(cfg.stderr_tail_lines);
            cfg.stderr_keep_lines =
                artifacts["stderr_keep_lines"].as<int>(cfg.stderr_keep_lines);
        }

        // Jobs section
        if (auto jobs = root["jobs"]) {
            cfg.declared_jobs_path = expand_home(
                jobs["declared_path"].as<std::string>(cfg.declared_jobs_path));
            cfg.declared_jobs_fallback_path = expand_home(
                jobs["declared_fallback_path"].as<std::string>(cfg.declared_jobs_fallback_path));
            cfg.runtime_jobs_path = expand_home(
                jobs["runtime_path"].as<std::string>(cfg.runtime_jobs_path));
        }

        // Status section
        if (auto status = root["status"]) {
            cfg.status_host = status["host"].as<std::string>(cfg.status_host);
            cfg.status_port = status["port"].as<int>(cfg.status_port);
        }

        // Logging section
        if (auto logging = root["logging"]) {
            cfg.log_level = logging["level"].as<std::string>(cfg.log_level);
        }
    } catch (const YAML::Exception&) {
        // Parse failed, use defaults
        return false;
    }

    config_ = std::move(cfg);
    return true;
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
