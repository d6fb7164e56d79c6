#pragma once

#include "core/config.hpp"

#include <cstdint>
#include <optional>

class StartupErrorStore;
class StderrLog;

/// Quick crashes counted since `window_start_ms`
struct CrashWindow {
    int count = 0;
    int64_t window_start_ms = 0;

    void reset() { count = 0; window_start_ms = 0; }
};

enum class BreakerVerdict { Restart, Open };

/// Classifies process exits by uptime. A crash after a healthy run resets the
/// window; `max_crashes` quick crashes inside one window open the breaker,
/// which then stays open and leaves a `circuit_breaker_open` artifact behind.
class CircuitBreaker {
public:
    CircuitBreaker(const BreakerSettings& settings,
                   const StartupErrorStore& errors,
                   const StderrLog& stderr_log,
                   int stderr_tail_lines = 50);

    BreakerVerdict record_exit(int64_t uptime_ms, int64_t now_ms,
                               std::optional<int> exit_code);

    bool is_open() const { return open_; }
    const CrashWindow& window() const { return window_; }
    const BreakerSettings& settings() const { return settings_; }

private:
    BreakerSettings settings_;
    const StartupErrorStore& errors_;
    const StderrLog& stderr_log_;
    int stderr_tail_lines_;
    CrashWindow window_;
    bool open_ = false;

    void persist(std::optional<int> exit_code) const;
};
