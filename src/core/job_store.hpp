#pragma once

#include "core/cron_job.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

/// Runtime job list as read from disk. `envelope` holds the surrounding
/// object when the file used the `{ "jobs": [...] }` layout.
struct RuntimeJobFile {
    std::vector<ScheduledJob> jobs;
    std::optional<nlohmann::json> envelope;
    bool malformed = false;
};

class JobStore {
public:
    JobStore(std::string declared_path,
             std::string declared_fallback_path,
             std::string runtime_path);

    /// Path of the declared source that will be read, empty if neither exists
    std::string declared_source() const;

    /// Read the declared job list. Returns nullopt when no source exists.
    /// Throws MalformedStateError when the source exists but cannot be parsed.
    std::optional<std::vector<DeclaredJob>> load_declared() const;

    /// Read the runtime job list. Never throws: a missing file is an empty
    /// list and an unparsable one is reported through `malformed`. Records
    /// of unknown shape are kept and written back unchanged.
    RuntimeJobFile load_runtime() const;

    /// Replace the runtime file. Keeps the envelope layout if `previous` had one.
    bool save_runtime(const std::vector<ScheduledJob>& jobs,
                      const RuntimeJobFile& previous) const;

    const std::string& runtime_path() const { return runtime_path_; }

private:
    std::string declared_path_;
    std::string declared_fallback_path_;
    std::string runtime_path_;

    /// Keep a copy of an unparsable runtime file before it is overwritten
    void preserve_malformed() const;
};
