#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

enum class StartupErrorKind {
    CircuitBreakerOpen,  // "circuit_breaker_open"
    ConfigInvalidJson,   // "config_invalid_json"
    LaunchFailed,        // "launch_failed"
};

std::string to_string(StartupErrorKind kind);

struct StartupErrorArtifact {
    StartupErrorKind kind = StartupErrorKind::CircuitBreakerOpen;
    std::string message;
    std::optional<int> exit_code;
    std::optional<int> crash_count;
    std::optional<std::string> stderr_tail;
    std::string timestamp;  // ISO-8601, seconds precision, with UTC offset

    nlohmann::json to_json() const;
};

/// Current local time as "2026-02-14T09:30:00+00:00"
std::string iso_timestamp_now();

/// Single-slot error artifact on disk. Written by the supervisor,
/// read verbatim by the status endpoint.
class StartupErrorStore {
public:
    explicit StartupErrorStore(std::string path);

    /// Atomically replace the artifact
    bool write(const StartupErrorArtifact& artifact) const;

    /// Raw file content, nullopt when absent or unreadable
    std::optional<std::string> read_raw() const;

    /// Remove the artifact. Succeeds when it is already absent.
    bool clear() const;

    bool exists() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
};
