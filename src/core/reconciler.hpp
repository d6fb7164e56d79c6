#pragma once

#include "core/cron_job.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

struct ReconcileResult {
    std::vector<ScheduledJob> jobs;
    int updated = 0;   // runtime jobs overwritten by a declared entry
    int added = 0;     // declared entries with no runtime counterpart
    int unmanaged = 0; // runtime jobs with no declared counterpart, kept as-is
};

/// Produces fresh job ids. The default yields random UUIDv4 strings.
using IdGenerator = std::function<std::string()>;

std::string generate_job_id();

/// Throws MalformedStateError if two declared entries share a name.
void validate_declared(const std::vector<DeclaredJob>& declared);

/// Merge the declared job list into the runtime list.
///
/// Jobs are joined by exact `name`. For matched jobs the declared fields win
/// (schedule, sessionTarget, wakeMode, payload, and agentId/enabled/delivery
/// when given) while id, createdAtMs, state and unmodeled keys come from the
/// runtime copy and updatedAtMs becomes `now_ms`. A job loaded from disk gets
/// the same fields written over its raw record. Runtime-only jobs pass
/// through untouched, whatever their shape. Declared-only entries become new jobs with an id that
/// does not collide with any runtime id.
///
/// Pure: performs no I/O.
ReconcileResult reconcile(const std::vector<DeclaredJob>& declared,
                          const std::vector<ScheduledJob>& runtime,
                          int64_t now_ms,
                          const IdGenerator& next_id = generate_job_id);
