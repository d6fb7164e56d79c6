#include "core/reconciler.hpp"
#include "core/errors.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

std::string generate_job_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();

    // RFC 4122 version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

void validate_declared(const std::vector<DeclaredJob>& declared) {
    std::unordered_set<std::string> names;
    for (const auto& job : declared) {
        if (!names.insert(job.name).second) {
            throw MalformedStateError("", "duplicate declared job name '" + job.name + "'");
        }
    }
}

ReconcileResult reconcile(const std::vector<DeclaredJob>& declared,
                          const std::vector<ScheduledJob>& runtime,
                          int64_t now_ms,
                          const IdGenerator& next_id) {
    std::unordered_map<std::string, const DeclaredJob*> by_name;
    for (const auto& dj : declared) {
        by_name[dj.name] = &dj;
    }

    ReconcileResult result;
    result.jobs.reserve(runtime.size() + declared.size());

    std::unordered_set<std::string> consumed;
    std::unordered_set<std::string> used_ids;

    for (const auto& rj : runtime) {
        if (!rj.id.empty()) used_ids.insert(rj.id);

        // Records without a usable name are never matched
        auto it = rj.name.empty() ? by_name.end() : by_name.find(rj.name);
        if (it == by_name.end()) {
            result.jobs.push_back(rj);
            ++result.unmanaged;
            continue;
        }

        const DeclaredJob& dj = *it->second;
        ScheduledJob merged = rj;
        merged.agent_id = dj.agent_id.value_or(rj.agent_id);
        merged.enabled = dj.enabled.value_or(rj.enabled);
        merged.schedule = dj.schedule;
        merged.session_target = dj.session_target;
        merged.wake_mode = dj.wake_mode;
        merged.payload = dj.payload;
        if (dj.delivery) merged.delivery = dj.delivery;
        merged.updated_at_ms = now_ms;

        // Declared fields go over the record as read; everything else stays
        if (merged.raw.is_object()) {
            nlohmann::json& raw = merged.raw;
            if (dj.agent_id) raw["agentId"] = *dj.agent_id;
            if (dj.enabled) raw["enabled"] = *dj.enabled;
            raw["schedule"] = schedule_to_json(dj.schedule);
            raw["sessionTarget"] = to_string(dj.session_target);
            raw["wakeMode"] = to_string(dj.wake_mode);
            raw["payload"] = dj.payload;
            if (dj.delivery) raw["delivery"] = *dj.delivery;
            raw["updatedAtMs"] = now_ms;
        }

        result.jobs.push_back(std::move(merged));
        consumed.insert(rj.name);
        ++result.updated;
    }

    for (const auto& dj : declared) {
        if (consumed.count(dj.name)) continue;
        // A duplicated name only seeds one job, from the last entry
        if (by_name[dj.name] != &dj) continue;

        std::string id = next_id();
        while (used_ids.count(id)) {
            id = next_id();
        }
        used_ids.insert(id);

        ScheduledJob job;
        job.id = std::move(id);
        job.agent_id = dj.agent_id.value_or("main");
        job.name = dj.name;
        job.enabled = dj.enabled.value_or(true);
        job.created_at_ms = now_ms;
        job.updated_at_ms = now_ms;
        job.schedule = dj.schedule;
        job.session_target = dj.session_target;
        job.wake_mode = dj.wake_mode;
        job.payload = dj.payload;
        job.delivery = dj.delivery;
        job.state = nlohmann::json::object();

        result.jobs.push_back(std::move(job));
        ++result.added;
    }

    return result;
}
