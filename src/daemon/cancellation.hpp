#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

/// Shutdown flag passed into the supervisor loop instead of process-wide
/// signal state. cancel() only stores an atomic flag.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

    /// Sleep up to `ms` in 100ms slices. Returns false if cancelled meanwhile.
    bool sleep_for(int ms) const {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
        while (!cancelled()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return true;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(100)));
        }
        return false;
    }

private:
    std::atomic<bool> cancelled_{false};
};
