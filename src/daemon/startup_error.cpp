#include "daemon/startup_error.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string to_string(StartupErrorKind kind) {
    switch (kind) {
        case StartupErrorKind::CircuitBreakerOpen: return "circuit_breaker_open";
        case StartupErrorKind::ConfigInvalidJson: return "config_invalid_json";
        case StartupErrorKind::LaunchFailed: return "launch_failed";
    }
    return "unknown";
}

json StartupErrorArtifact::to_json() const {
    json j;
    j["error"] = to_string(kind);
    j["message"] = message;
    if (exit_code) j["exitCode"] = *exit_code;
    if (crash_count) j["crashCount"] = *crash_count;
    if (stderr_tail) j["stderr"] = *stderr_tail;
    j["timestamp"] = timestamp;
    return j;
}

std::string iso_timestamp_now() {
    auto t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S%z", &tm);

    // strftime gives +hhmm, ISO-8601 extended wants +hh:mm
    std::string out(buf);
    if (out.size() >= 5) {
        out.insert(out.size() - 2, ":");
    }
    return out;
}

StartupErrorStore::StartupErrorStore(std::string path) : path_(std::move(path)) {}

bool StartupErrorStore::write(const StartupErrorArtifact& artifact) const {
    if (path_.empty()) return false;

    try {
        fs::path p(path_);
        if (p.has_parent_path()) {
            fs::create_directories(p.parent_path());
        }

        std::string tmp = path_ + ".tmp";
        std::ofstream out(tmp);
        if (!out.is_open()) return false;
        out << artifact.to_json().dump() << "\n";
        out.close();
        if (out.fail()) return false;
        fs::rename(tmp, path_);
        return true;
    } catch (const fs::filesystem_error& e) {
        spdlog::error("Failed to write startup error artifact {}: {}", path_, e.what());
        return false;
    }
}

std::optional<std::string> StartupErrorStore::read_raw() const {
    std::ifstream in(path_);
    if (!in.is_open()) return std::nullopt;
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool StartupErrorStore::clear() const {
    std::error_code ec;
    fs::remove(path_, ec);
    return !ec;
}

bool StartupErrorStore::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}
