#include "daemon/stderr_log.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <deque>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::deque<std::string> last_lines(const std::string& path, int count) {
    std::deque<std::string> lines;
    if (count <= 0) return lines;

    std::ifstream in(path);
    if (!in.is_open()) return lines;

    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(std::move(line));
        if (static_cast<int>(lines.size()) > count) {
            lines.pop_front();
        }
    }
    return lines;
}

} // namespace

StderrLog::StderrLog(std::string path) : path_(std::move(path)) {}

std::string StderrLog::tail(int lines) const {
    std::string out;
    for (const auto& line : last_lines(path_, lines)) {
        if (!out.empty()) out += '\n';
        out += line;
    }
    return out;
}

bool StderrLog::trim(int keep_lines) const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) return true;

    auto lines = last_lines(path_, keep_lines);

    std::string tmp = path_ + ".tmp";
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) return false;
    for (const auto& line : lines) {
        out << line << '\n';
    }
    out.close();
    if (out.fail()) return false;

    fs::rename(tmp, path_, ec);
    return !ec;
}

int StderrLog::open_for_append() const {
    std::error_code ec;
    fs::path p(path_);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
    }
    return ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
}
