#include "api/status_server.hpp"
#include "daemon/startup_error.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

using json = nlohmann::json;

namespace {

constexpr int kStatusProbeTimeoutMs = 5000;

bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

struct StatusServer::Impl {
    const AppConfig& config;
    const StartupErrorStore& errors;
    std::function<pid_t()> active_pid;
    PortProbe probe;

    httplib::Server server;
    std::thread thread;
    int port = 0;

    Impl(const AppConfig& cfg, const StartupErrorStore& errs)
        : config(cfg), errors(errs) {}
};

StatusServer::StatusServer(const AppConfig& config,
                           const StartupErrorStore& errors,
                           std::function<pid_t()> active_pid,
                           PortProbe probe)
    : impl_(std::make_unique<Impl>(config, errors)) {
    impl_->active_pid = std::move(active_pid);
    if (probe) {
        impl_->probe = std::move(probe);
    } else {
        std::string host = config.service.host;
        int port = config.service.port;
        impl_->probe = [host, port](int timeout_ms) { return probe_tcp(host, port, timeout_ms); };
    }

    impl_->server.Get("/sandbox-health", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(health().dump(), "application/json");
    });

    impl_->server.Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(status().dump(), "application/json");
    });
}

StatusServer::~StatusServer() {
    stop();
}

bool StatusServer::start(const std::string& host, int port) {
    if (impl_->thread.joinable()) return true;

    if (port == 0) {
        port = impl_->server.bind_to_any_port(host);
        if (port <= 0) return false;
    } else if (!impl_->server.bind_to_port(host, port)) {
        spdlog::error("[status] Cannot bind {}:{}", host, port);
        return false;
    }
    impl_->port = port;

    impl_->thread = std::thread([this] { impl_->server.listen_after_bind(); });

    // stop() is a no-op until the accept loop is up
    for (int i = 0; i < 200 && !impl_->server.is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    spdlog::info("[status] Serving status on {}:{}", host, port);
    return true;
}

void StatusServer::stop() {
    if (impl_->thread.joinable()) {
        impl_->server.stop();
        impl_->thread.join();
        impl_->port = 0;
    }
}

int StatusServer::port() const {
    return impl_->port;
}

json StatusServer::health() const {
    return {
        {"status", "ok"},
        {"service", "gatewarden"},
        {"gateway_port", impl_->config.service.port},
    };
}

json StatusServer::status() const {
    // A written artifact means supervision gave up; report it verbatim
    auto raw = impl_->errors.read_raw();
    if (raw && !blank(*raw)) {
        json error;
        try {
            error = json::parse(*raw);
        } catch (const json::parse_error&) {
            error = {{"message", *raw}};
        }
        return {{"ok", false}, {"status", "startup_failed"}, {"error", error}};
    }

    pid_t pid = impl_->active_pid ? impl_->active_pid() : -1;
    if (pid <= 0) {
        return {{"ok", false}, {"status", "not_running"}};
    }

    if (impl_->probe(kStatusProbeTimeoutMs)) {
        return {{"ok", true}, {"status", "running"}, {"processId", pid}};
    }
    return {{"ok", false}, {"status", "not_responding"}, {"processId", pid}};
}
