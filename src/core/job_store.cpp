#include "core/job_store.hpp"
#include "core/errors.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw MalformedStateError(path, "cannot open file");
    }
    std::stringstream ss;
    ss << in.rdbuf();
    try {
        return json::parse(ss.str());
    } catch (const json::parse_error& e) {
        throw MalformedStateError(path, e.what());
    }
}

} // namespace

JobStore::JobStore(std::string declared_path,
                   std::string declared_fallback_path,
                   std::string runtime_path)
    : declared_path_(std::move(declared_path)),
      declared_fallback_path_(std::move(declared_fallback_path)),
      runtime_path_(std::move(runtime_path)) {}

std::string JobStore::declared_source() const {
    std::error_code ec;
    if (!declared_path_.empty() && fs::exists(declared_path_, ec)) {
        return declared_path_;
    }
    if (!declared_fallback_path_.empty() && fs::exists(declared_fallback_path_, ec)) {
        return declared_fallback_path_;
    }
    return "";
}

std::optional<std::vector<DeclaredJob>> JobStore::load_declared() const {
    std::string path = declared_source();
    if (path.empty()) return std::nullopt;

    json root = read_json_file(path);
    if (!root.is_array()) {
        throw MalformedStateError(path, "declared job list must be a JSON array");
    }

    std::vector<DeclaredJob> jobs;
    jobs.reserve(root.size());
    for (size_t i = 0; i < root.size(); ++i) {
        try {
            jobs.push_back(declared_job_from_json(root[i]));
        } catch (const MalformedStateError& e) {
            throw MalformedStateError(path, "entry " + std::to_string(i) + ": " + e.what());
        }
    }
    return jobs;
}

RuntimeJobFile JobStore::load_runtime() const {
    RuntimeJobFile file;
    std::error_code ec;
    if (runtime_path_.empty() || !fs::exists(runtime_path_, ec)) {
        return file;
    }

    try {
        json root = read_json_file(runtime_path_);

        const json* list = &root;
        if (root.is_object()) {
            auto jobs = root.find("jobs");
            if (jobs == root.end() || !jobs->is_array()) {
                throw MalformedStateError(runtime_path_, "object layout without a 'jobs' array");
            }
            list = &*jobs;
            file.envelope = root;
        } else if (!root.is_array()) {
            throw MalformedStateError(runtime_path_, "expected an array or an object with 'jobs'");
        }

        // Individual records are never rejected; unreadable ones pass through as-is
        for (const auto& record : *list) {
            file.jobs.push_back(scheduled_job_from_json(record));
        }
    } catch (const MalformedStateError& e) {
        spdlog::warn("[reconcile] Could not parse runtime jobs, starting from an empty list: {}",
                     e.what());
        file.jobs.clear();
        file.envelope.reset();
        file.malformed = true;
    }
    return file;
}

void JobStore::preserve_malformed() const {
    std::error_code ec;
    std::string backup = runtime_path_ + ".malformed";
    fs::copy_file(runtime_path_, backup, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::warn("[reconcile] Could not back up {}: {}", runtime_path_, ec.message());
    } else {
        spdlog::info("[reconcile] Unparsable runtime jobs saved to {}", backup);
    }
}

bool JobStore::save_runtime(const std::vector<ScheduledJob>& jobs,
                            const RuntimeJobFile& previous) const {
    if (runtime_path_.empty()) return false;

    json list = json::array();
    for (const auto& job : jobs) {
        list.push_back(job_to_json(job));
    }

    json root;
    if (previous.envelope) {
        root = *previous.envelope;
        root["jobs"] = std::move(list);
    } else {
        root = std::move(list);
    }

    try {
        fs::path path(runtime_path_);
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        if (previous.malformed) {
            preserve_malformed();
        }

        // Atomic write: write to temp file, then rename
        std::string tmp = runtime_path_ + ".tmp";
        std::ofstream out(tmp);
        if (!out.is_open()) return false;
        out << root.dump(2) << "\n";
        out.close();
        if (out.fail()) return false;
        fs::rename(tmp, runtime_path_);
        return true;
    } catch (const fs::filesystem_error& e) {
        spdlog::error("[reconcile] Failed to write {}: {}", runtime_path_, e.what());
        return false;
    }
}
