#include "daemon/startup_race.hpp"
#include "daemon/process.hpp"
#include "daemon/startup_error.hpp"
#include "daemon/stderr_log.hpp"
#include "core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace {

bool connect_with_timeout(const struct addrinfo* ai, int timeout_ms) {
    int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                    ai->ai_protocol);
    if (fd < 0) return false;

    bool ok = false;
    if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
        ok = true;
    } else if (errno == EINPROGRESS) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int ret;
        do {
            ret = poll(&pfd, 1, timeout_ms);
        } while (ret < 0 && errno == EINTR);

        if (ret > 0) {
            int err = 0;
            socklen_t len = sizeof(err);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0) {
                ok = true;
            }
        }
    }

    close(fd);
    return ok;
}

int64_t elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace

bool probe_tcp(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    if (getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0 || !res) {
        return false;
    }

    bool ok = false;
    for (auto* ai = res; ai != nullptr && !ok; ai = ai->ai_next) {
        ok = connect_with_timeout(ai, timeout_ms);
    }
    freeaddrinfo(res);
    return ok;
}

StartupRaceDetector::StartupRaceDetector(PortProbe probe, int poll_interval_ms)
    : probe_(std::move(probe)), poll_interval_ms_(std::max(1, poll_interval_ms)) {}

StartupRaceDetector StartupRaceDetector::for_tcp(const std::string& host, int port,
                                                 int poll_interval_ms) {
    return StartupRaceDetector(
        [host, port](int timeout_ms) { return probe_tcp(host, port, timeout_ms); },
        poll_interval_ms);
}

RaceOutcome StartupRaceDetector::race(ProcessHandle& process, int timeout_ms) const {
    auto start = std::chrono::steady_clock::now();
    RaceOutcome outcome;

    while (true) {
        if (process.poll_exit()) {
            outcome.kind = RaceOutcome::Kind::Exited;
            outcome.exit_code = process.exit_code();
            break;
        }

        int64_t remaining = timeout_ms - elapsed_since(start);
        if (remaining <= 0) {
            outcome.kind = RaceOutcome::Kind::TimedOut;
            break;
        }

        int slice = static_cast<int>(std::min<int64_t>(remaining, poll_interval_ms_));
        auto probe_start = std::chrono::steady_clock::now();
        if (probe_(slice)) {
            process.mark_running();
            outcome.kind = RaceOutcome::Kind::Reachable;
            break;
        }

        // A refused connection returns at once; don't spin
        int64_t left_in_slice = slice - elapsed_since(probe_start);
        if (left_in_slice > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(left_in_slice));
        }
    }

    outcome.elapsed_ms = elapsed_since(start);
    return outcome;
}

void ensure_reachable(const RaceOutcome& outcome,
                      const StartupErrorStore& errors,
                      const StderrLog& stderr_log,
                      int stderr_tail_lines) {
    switch (outcome.kind) {
        case RaceOutcome::Kind::Reachable:
            return;

        case RaceOutcome::Kind::Exited: {
            auto artifact = errors.read_raw();
            std::string tail = stderr_log.tail(stderr_tail_lines);
            std::string code = outcome.exit_code ? std::to_string(*outcome.exit_code)
                                                 : std::string("unknown");
            spdlog::error("[race] Process exited before port was ready, exit code {}", code);
            if (!tail.empty()) spdlog::error("[race] stderr: {}", tail);

            throw ProcessExitError(
                "Service process exited with code " + code +
                    ". Stderr: " + (tail.empty() ? std::string("(empty)") : tail),
                outcome.exit_code, artifact, tail);
        }

        case RaceOutcome::Kind::TimedOut:
            throw TimeoutError("Service not reachable after " +
                               std::to_string(outcome.elapsed_ms) + "ms");
    }
}
