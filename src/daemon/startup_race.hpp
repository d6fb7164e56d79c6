#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

class ProcessHandle;
class StartupErrorStore;
class StderrLog;

struct RaceOutcome {
    enum class Kind { Reachable, Exited, TimedOut };

    Kind kind = Kind::TimedOut;
    std::optional<int> exit_code;  // Exited only, absent for attached processes
    int64_t elapsed_ms = 0;
};

/// One TCP reachability check, bounded by `timeout_ms`
using PortProbe = std::function<bool(int timeout_ms)>;

/// True if a TCP connection to host:port is accepted within `timeout_ms`
bool probe_tcp(const std::string& host, int port, int timeout_ms);

/// Waits for whichever comes first: the service accepting connections or the
/// process exiting. Both conditions are polled from the calling thread and
/// share one timeout budget; exactly one outcome is returned.
class StartupRaceDetector {
public:
    explicit StartupRaceDetector(PortProbe probe, int poll_interval_ms = 250);

    static StartupRaceDetector for_tcp(const std::string& host, int port,
                                       int poll_interval_ms = 250);

    RaceOutcome race(ProcessHandle& process, int timeout_ms) const;

private:
    PortProbe probe_;
    int poll_interval_ms_;
};

/// Returns on Reachable. Throws ProcessExitError (with the startup error
/// artifact and stderr tail attached) on Exited, TimeoutError on TimedOut.
void ensure_reachable(const RaceOutcome& outcome,
                      const StartupErrorStore& errors,
                      const StderrLog& stderr_log,
                      int stderr_tail_lines);
