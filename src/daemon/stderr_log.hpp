#pragma once

#include <string>

/// Rolling capture file for the supervised process's stderr.
/// The child appends to it directly; the supervisor trims it between launches.
class StderrLog {
public:
    explicit StderrLog(std::string path);

    /// Last `lines` lines, empty if nothing was captured
    std::string tail(int lines) const;

    /// Drop everything but the last `keep_lines` lines
    bool trim(int keep_lines) const;

    /// Open for appending with close-on-exec; dup2 onto the child's stderr
    /// clears the flag. Returns -1 on failure.
    int open_for_append() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
