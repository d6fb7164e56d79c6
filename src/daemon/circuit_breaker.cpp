#include "daemon/circuit_breaker.hpp"
#include "daemon/startup_error.hpp"
#include "daemon/stderr_log.hpp"

#include <spdlog/spdlog.h>

CircuitBreaker::CircuitBreaker(const BreakerSettings& settings,
                               const StartupErrorStore& errors,
                               const StderrLog& stderr_log,
                               int stderr_tail_lines)
    : settings_(settings),
      errors_(errors),
      stderr_log_(stderr_log),
      stderr_tail_lines_(stderr_tail_lines) {}

BreakerVerdict CircuitBreaker::record_exit(int64_t uptime_ms, int64_t now_ms,
                                           std::optional<int> exit_code) {
    if (open_) return BreakerVerdict::Open;

    // Long-lived process that died (OOM etc.): not a config problem
    if (uptime_ms >= settings_.window_ms) {
        window_.reset();
        return BreakerVerdict::Restart;
    }

    int64_t elapsed = 0;
    if (window_.count == 0 || now_ms - window_.window_start_ms >= settings_.window_ms) {
        window_.count = 1;
        window_.window_start_ms = now_ms;
    } else {
        elapsed = now_ms - window_.window_start_ms;
        ++window_.count;
    }

    spdlog::warn("[breaker] Quick crash detected ({}ms uptime, crash {}/{} in {}ms window)",
                 uptime_ms, window_.count, settings_.max_crashes, elapsed);

    if (window_.count < settings_.max_crashes) {
        return BreakerVerdict::Restart;
    }

    open_ = true;
    spdlog::error("[breaker] CIRCUIT BREAKER OPEN: crashed {} times within {}ms",
                  window_.count, settings_.window_ms);
    spdlog::error("[breaker] This likely indicates a configuration error. Check stderr log: {}",
                  stderr_log_.path());
    persist(exit_code);
    return BreakerVerdict::Open;
}

void CircuitBreaker::persist(std::optional<int> exit_code) const {
    StartupErrorArtifact artifact;
    artifact.kind = StartupErrorKind::CircuitBreakerOpen;
    artifact.message = "Service crashed " + std::to_string(window_.count) + " times within " +
                       std::to_string(settings_.window_ms / 1000) +
                       "s. Likely a configuration error.";
    artifact.exit_code = exit_code;
    artifact.crash_count = window_.count;

    std::string tail = stderr_log_.tail(stderr_tail_lines_);
    artifact.stderr_tail = tail.empty() ? "(no stderr captured)" : tail;
    artifact.timestamp = iso_timestamp_now();

    if (errors_.write(artifact)) {
        spdlog::error("[breaker] Error details written to {}", errors_.path());
    } else {
        spdlog::error("[breaker] Could not write error details to {}", errors_.path());
    }
}
