#pragma once

#include <optional>
#include <stdexcept>
#include <string>

/// Base for every failure gatewarden raises itself.
class GatewardenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The executable or its environment is broken. Never retried.
class LaunchError : public GatewardenError {
public:
    using GatewardenError::GatewardenError;
};

/// Process neither became reachable nor exited within the startup budget.
class TimeoutError : public GatewardenError {
public:
    using GatewardenError::GatewardenError;
};

/// Process exited before it became reachable.
class ProcessExitError : public GatewardenError {
public:
    ProcessExitError(const std::string& message,
                     std::optional<int> exit_code,
                     std::optional<std::string> artifact,
                     std::string stderr_tail)
        : GatewardenError(message),
          exit_code_(exit_code),
          artifact_(std::move(artifact)),
          stderr_tail_(std::move(stderr_tail)) {}

    std::optional<int> exit_code() const { return exit_code_; }
    /// Raw content of the startup error artifact, if one was written
    const std::optional<std::string>& artifact() const { return artifact_; }
    const std::string& stderr_tail() const { return stderr_tail_; }

private:
    std::optional<int> exit_code_;
    std::optional<std::string> artifact_;
    std::string stderr_tail_;
};

/// Crash-rate threshold exceeded. The artifact on disk explains why.
class CircuitBreakerOpenError : public GatewardenError {
public:
    CircuitBreakerOpenError(const std::string& message, int crash_count)
        : GatewardenError(message), crash_count_(crash_count) {}

    int crash_count() const { return crash_count_; }

private:
    int crash_count_;
};

/// A declared or runtime job file could not be parsed.
class MalformedStateError : public GatewardenError {
public:
    MalformedStateError(const std::string& path, const std::string& reason)
        : GatewardenError(path.empty() ? reason : path + ": " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
