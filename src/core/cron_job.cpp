#include "core/cron_job.hpp"
#include "core/errors.hpp"

#include <set>

using json = nlohmann::json;

namespace {

const std::set<std::string> kScheduleKeys = {"kind", "expr", "tz", "everyMs", "anchorMs"};

const std::set<std::string> kModeledKeys = {
    "id", "agentId", "name", "enabled", "createdAtMs", "updatedAtMs",
    "schedule", "sessionTarget", "wakeMode", "payload", "delivery", "state",
};

[[noreturn]] void malformed(const std::string& what) {
    throw MalformedStateError("", what);
}

const json& require(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        malformed(std::string("missing field '") + key + "'");
    }
    return *it;
}

std::string require_string(const json& j, const char* key) {
    const json& v = require(j, key);
    if (!v.is_string()) malformed(std::string("field '") + key + "' must be a string");
    return v.get<std::string>();
}

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) malformed(std::string("field '") + key + "' must be a string");
    return it->get<std::string>();
}

std::optional<bool> optional_bool(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_boolean()) malformed(std::string("field '") + key + "' must be a boolean");
    return it->get<bool>();
}

std::optional<int64_t> optional_ms(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_number()) malformed(std::string("field '") + key + "' must be a number");
    return it->get<int64_t>();
}

json require_object(const json& j, const char* key) {
    const json& v = require(j, key);
    if (!v.is_object()) malformed(std::string("field '") + key + "' must be an object");
    return v;
}

SessionTarget require_session_target(const json& j) {
    std::string s = require_string(j, "sessionTarget");
    auto target = parse_session_target(s);
    if (!target) malformed("unknown sessionTarget '" + s + "'");
    return *target;
}

WakeMode require_wake_mode(const json& j) {
    std::string s = require_string(j, "wakeMode");
    auto mode = parse_wake_mode(s);
    if (!mode) malformed("unknown wakeMode '" + s + "'");
    return *mode;
}

// Lenient readers for runtime records

std::string string_or(const json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : fallback;
}

bool bool_or(const json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    return (it != j.end() && it->is_boolean()) ? it->get<bool>() : fallback;
}

int64_t ms_or(const json& j, const char* key, int64_t fallback) {
    auto it = j.find(key);
    return (it != j.end() && it->is_number()) ? it->get<int64_t>() : fallback;
}

} // namespace

bool Schedule::operator==(const Schedule& other) const {
    return kind == other.kind && expr == other.expr && tz == other.tz &&
           every_ms == other.every_ms && anchor_ms == other.anchor_ms &&
           extra == other.extra;
}

std::string to_string(SessionTarget target) {
    switch (target) {
        case SessionTarget::Main: return "main";
        case SessionTarget::Isolated: return "isolated";
    }
    return "main";
}

std::string to_string(WakeMode mode) {
    switch (mode) {
        case WakeMode::Now: return "now";
        case WakeMode::NextHeartbeat: return "next-heartbeat";
    }
    return "now";
}

std::optional<SessionTarget> parse_session_target(const std::string& s) {
    if (s == "main") return SessionTarget::Main;
    if (s == "isolated") return SessionTarget::Isolated;
    return std::nullopt;
}

std::optional<WakeMode> parse_wake_mode(const std::string& s) {
    if (s == "now") return WakeMode::Now;
    if (s == "next-heartbeat") return WakeMode::NextHeartbeat;
    return std::nullopt;
}

// ── Schedule ────────────────────────────────────────────────

json schedule_to_json(const Schedule& schedule) {
    json j = schedule.extra.is_object() ? schedule.extra : json::object();
    if (schedule.kind == Schedule::Kind::Cron) {
        j["kind"] = "cron";
        j["expr"] = schedule.expr;
        if (schedule.tz) j["tz"] = *schedule.tz;
    } else {
        j["kind"] = "every";
        j["everyMs"] = schedule.every_ms;
        if (schedule.anchor_ms) j["anchorMs"] = *schedule.anchor_ms;
    }
    return j;
}

Schedule schedule_from_json(const json& j) {
    if (!j.is_object()) malformed("schedule must be an object");

    Schedule s;
    std::string kind = require_string(j, "kind");
    if (kind == "cron") {
        s.kind = Schedule::Kind::Cron;
        s.expr = require_string(j, "expr");
        if (s.expr.empty()) malformed("cron schedule has an empty expression");
        s.tz = optional_string(j, "tz");
    } else if (kind == "every") {
        s.kind = Schedule::Kind::Every;
        auto every = optional_ms(j, "everyMs");
        if (!every || *every <= 0) malformed("interval schedule needs a positive everyMs");
        s.every_ms = *every;
        s.anchor_ms = optional_ms(j, "anchorMs");
    } else {
        malformed("unknown schedule kind '" + kind + "'");
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (kScheduleKeys.count(it.key()) == 0) {
            s.extra[it.key()] = it.value();
        }
    }
    return s;
}

// ── ScheduledJob ────────────────────────────────────────────

json job_to_json(const ScheduledJob& job) {
    if (!job.raw.is_null()) return job.raw;

    json j = job.extra.is_object() ? job.extra : json::object();
    j["id"] = job.id;
    j["agentId"] = job.agent_id;
    j["name"] = job.name;
    j["enabled"] = job.enabled;
    j["createdAtMs"] = job.created_at_ms;
    j["updatedAtMs"] = job.updated_at_ms;
    j["schedule"] = schedule_to_json(job.schedule);
    j["sessionTarget"] = to_string(job.session_target);
    j["wakeMode"] = to_string(job.wake_mode);
    j["payload"] = job.payload;
    if (job.delivery) j["delivery"] = *job.delivery;
    if (job.state) j["state"] = *job.state;
    return j;
}

ScheduledJob scheduled_job_from_json(const json& j) {
    ScheduledJob job;
    job.raw = j;
    if (!j.is_object()) return job;

    job.id = string_or(j, "id", "");
    job.name = string_or(j, "name", "");
    job.agent_id = string_or(j, "agentId", job.agent_id);
    job.enabled = bool_or(j, "enabled", true);
    job.created_at_ms = ms_or(j, "createdAtMs", 0);
    job.updated_at_ms = ms_or(j, "updatedAtMs", job.created_at_ms);

    auto schedule = j.find("schedule");
    if (schedule != j.end()) {
        try {
            job.schedule = schedule_from_json(*schedule);
        } catch (const MalformedStateError&) {
            // Kinds this version does not model are carried only in raw
        }
    }
    job.session_target = parse_session_target(string_or(j, "sessionTarget", ""))
                             .value_or(SessionTarget::Main);
    job.wake_mode = parse_wake_mode(string_or(j, "wakeMode", "")).value_or(WakeMode::Now);

    auto payload = j.find("payload");
    if (payload != j.end() && payload->is_object()) job.payload = *payload;
    auto delivery = j.find("delivery");
    if (delivery != j.end() && !delivery->is_null()) job.delivery = *delivery;
    auto state = j.find("state");
    if (state != j.end() && !state->is_null()) job.state = *state;

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (kModeledKeys.count(it.key()) == 0) {
            job.extra[it.key()] = it.value();
        }
    }
    return job;
}

// ── DeclaredJob ─────────────────────────────────────────────

DeclaredJob declared_job_from_json(const json& j) {
    if (!j.is_object()) malformed("declared job must be an object");

    DeclaredJob job;
    job.name = require_string(j, "name");
    if (job.name.empty()) malformed("declared job has an empty name");
    job.agent_id = optional_string(j, "agentId");
    job.enabled = optional_bool(j, "enabled");
    job.schedule = schedule_from_json(require(j, "schedule"));
    job.session_target = require_session_target(j);
    job.wake_mode = require_wake_mode(j);
    job.payload = require_object(j, "payload");

    auto delivery = j.find("delivery");
    if (delivery != j.end() && !delivery->is_null()) job.delivery = *delivery;
    return job;
}
