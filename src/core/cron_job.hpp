#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

struct Schedule {
    enum class Kind { Cron, Every };

    Kind kind = Kind::Cron;
    std::string expr;                  // cron only
    std::optional<std::string> tz;     // cron only
    int64_t every_ms = 0;              // every only
    std::optional<int64_t> anchor_ms;  // every only

    /// Keys beyond the modeled ones, kept verbatim
    nlohmann::json extra = nlohmann::json::object();

    bool operator==(const Schedule& other) const;
    bool operator!=(const Schedule& other) const { return !(*this == other); }
};

enum class SessionTarget { Main, Isolated };
enum class WakeMode { Now, NextHeartbeat };

/// Job as persisted by the running service. Carries identity and bookkeeping.
struct ScheduledJob {
    std::string id;
    std::string agent_id = "main";
    std::string name;
    bool enabled = true;
    int64_t created_at_ms = 0;
    int64_t updated_at_ms = 0;
    Schedule schedule;
    SessionTarget session_target = SessionTarget::Main;
    WakeMode wake_mode = WakeMode::Now;
    nlohmann::json payload = nlohmann::json::object();
    std::optional<nlohmann::json> delivery;
    std::optional<nlohmann::json> state;

    /// Top-level keys this version does not model, kept verbatim
    nlohmann::json extra = nlohmann::json::object();

    /// Record exactly as read from disk; null for jobs created in-process.
    /// When set it is what gets written back, so fields that could not be
    /// modeled (unknown schedule kinds, odd payloads) survive untouched.
    nlohmann::json raw;
};

/// Job as checked into version control. No id, no state.
struct DeclaredJob {
    std::string name;
    std::optional<std::string> agent_id;
    std::optional<bool> enabled;
    Schedule schedule;
    SessionTarget session_target = SessionTarget::Main;
    WakeMode wake_mode = WakeMode::Now;
    nlohmann::json payload = nlohmann::json::object();
    std::optional<nlohmann::json> delivery;
};

// String forms used on disk
std::string to_string(SessionTarget target);
std::string to_string(WakeMode mode);
std::optional<SessionTarget> parse_session_target(const std::string& s);
std::optional<WakeMode> parse_wake_mode(const std::string& s);

// JSON conversion. Parsers throw MalformedStateError with an empty path;
// callers that know the file rethrow with it.
nlohmann::json schedule_to_json(const Schedule& schedule);
Schedule schedule_from_json(const nlohmann::json& j);

nlohmann::json job_to_json(const ScheduledJob& job);

/// Lenient: never throws. Fields that are missing or of an unexpected shape
/// keep their defaults in the model and stay as they were in `raw`.
ScheduledJob scheduled_job_from_json(const nlohmann::json& j);
DeclaredJob declared_job_from_json(const nlohmann::json& j);
