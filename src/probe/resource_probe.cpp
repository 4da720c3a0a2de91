/**
 * Warden Resource Probe - Implementation
 *
 * Reads process and memory state from the Linux /proc filesystem.
 */

#include "probe/resource_probe.hpp"
#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <fstream>
#include <regex>
#include <sstream>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace warden::probe {

// ============================================================================
// JSON Conversion
// ============================================================================

nlohmann::json WorkerRole::to_json() const {
    return nlohmann::json{
        {"name", name},
        {"pattern", pattern},
        {"uid", uid ? nlohmann::json(*uid) : nlohmann::json(nullptr)}
    };
}

nlohmann::json ProcessInfo::to_json() const {
    return nlohmann::json{
        {"pid", pid},
        {"ppid", ppid},
        {"state", std::string(1, state)},
        {"uid", uid},
        {"age_seconds", age_seconds},
        {"name", name},
        {"cmdline", cmdline}
    };
}

// ============================================================================
// Artifacts
// ============================================================================

std::vector<fs::path> ResourceProbe::list_artifacts_oldest_first(
    const fs::path& directory, const std::string& pattern) const {
    struct Entry {
        fs::path path;
        fs::file_time_type mtime;
    };
    std::vector<Entry> entries;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return {};
    }

    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;
        auto name = entry.path().filename().string();
        if (fnmatch(pattern.c_str(), name.c_str(), 0) != 0) continue;

        auto mtime = entry.last_write_time(entry_ec);
        if (entry_ec) continue;  // Deleted between listing and stat
        entries.push_back({entry.path(), mtime});
    }
    if (ec) {
        throw ProbeUnavailable("cannot list " + directory.string() + ": " + ec.message());
    }

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (a.mtime != b.mtime) return a.mtime < b.mtime;
        return a.path < b.path;
    });

    std::vector<fs::path> result;
    result.reserve(entries.size());
    for (auto& e : entries) {
        result.push_back(std::move(e.path));
    }
    return result;
}

// ============================================================================
// ProcProbe
// ============================================================================

ProcProbe::ProcProbe(fs::path proc_root)
    : proc_root_(std::move(proc_root)) {
    ticks_per_sec_ = sysconf(_SC_CLK_TCK);
    if (ticks_per_sec_ <= 0) ticks_per_sec_ = 100;
}

std::string ProcProbe::read_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) return "";
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string> ProcProbe::read_file_lines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    if (!file) return lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::vector<pid_t> ProcProbe::list_pids() {
    std::vector<pid_t> pids;
    std::error_code ec;
    fs::directory_iterator it(proc_root_, ec);
    if (ec) {
        throw ProbeUnavailable("cannot read " + proc_root_.string() + ": " + ec.message());
    }

    for (const auto& entry : it) {
        auto name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(),
                [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        pids.push_back(static_cast<pid_t>(std::stol(name)));
    }
    return pids;
}

double ProcProbe::uptime_seconds() {
    std::istringstream iss(read_file(proc_root_ / "uptime"));
    double uptime = 0.0;
    if (!(iss >> uptime)) {
        throw ProbeUnavailable("cannot read " + (proc_root_ / "uptime").string());
    }
    return uptime;
}

std::optional<ProcessInfo> ProcProbe::read_process(pid_t pid) {
    auto proc_path = proc_root_ / std::to_string(pid);

    std::string stat_content = read_file(proc_path / "stat");
    if (stat_content.empty()) return std::nullopt;

    // comm may contain spaces and parentheses: fields resume after the last ')'
    size_t comm_start = stat_content.find('(');
    size_t comm_end = stat_content.rfind(')');
    if (comm_start == std::string::npos || comm_end == std::string::npos ||
        comm_end < comm_start || comm_end + 2 > stat_content.size()) {
        return std::nullopt;
    }

    ProcessInfo info;
    info.pid = pid;
    info.name = stat_content.substr(comm_start + 1, comm_end - comm_start - 1);

    std::istringstream iss(stat_content.substr(comm_end + 2));
    int ppid = 0;
    std::string skip;
    iss >> info.state >> ppid;
    // Fields 5..21 (pgrp .. itrealvalue) are not needed
    for (int i = 0; i < 17 && iss; ++i) {
        iss >> skip;
    }
    iss >> info.start_ticks;
    if (!iss) return std::nullopt;
    info.ppid = static_cast<pid_t>(ppid);

    struct stat st;
    if (stat(proc_path.c_str(), &st) == 0) {
        info.uid = st.st_uid;
    }

    double started = static_cast<double>(info.start_ticks) / ticks_per_sec_;
    info.age_seconds = std::max(0.0, uptime_seconds() - started);

    info.cmdline = read_file(proc_path / "cmdline");
    std::replace(info.cmdline.begin(), info.cmdline.end(), '\0', ' ');
    if (!info.cmdline.empty() && info.cmdline.back() == ' ') {
        info.cmdline.pop_back();
    }
    return info;
}

std::vector<ProcessInfo> ProcProbe::list_workers(const WorkerRole& role) {
    std::regex matcher(role.pattern);
    pid_t self = getpid();

    std::vector<ProcessInfo> workers;
    for (pid_t pid : list_pids()) {
        if (pid == self) continue;
        auto info = read_process(pid);
        if (!info) continue;
        if (info->state == 'Z' || info->cmdline.empty()) continue;
        if (role.uid && info->uid != *role.uid) continue;
        if (!std::regex_search(info->cmdline, matcher)) continue;
        workers.push_back(std::move(*info));
    }

    std::sort(workers.begin(), workers.end(), [](const ProcessInfo& a, const ProcessInfo& b) {
        if (a.start_ticks != b.start_ticks) return a.start_ticks < b.start_ticks;
        return a.pid < b.pid;
    });
    return workers;
}

std::optional<double> ProcProbe::process_age(pid_t pid) {
    auto info = read_process(pid);
    if (!info || info->state == 'Z') return std::nullopt;
    return info->age_seconds;
}

std::optional<pid_t> ProcProbe::parent_of(pid_t pid) {
    auto info = read_process(pid);
    if (!info) return std::nullopt;
    return info->ppid;
}

double ProcProbe::free_memory_gb() {
    auto lines = read_file_lines(proc_root_ / "meminfo");
    for (const auto& line : lines) {
        std::istringstream iss(line);
        std::string key;
        uint64_t kb = 0;
        iss >> key >> kb;
        if (key == "MemAvailable:" && iss) {
            return static_cast<double>(kb) / (1024.0 * 1024.0);
        }
    }
    throw ProbeUnavailable("MemAvailable missing from " + (proc_root_ / "meminfo").string());
}

double ProcProbe::load_average() {
    std::istringstream iss(read_file(proc_root_ / "loadavg"));
    double load_1m = 0.0;
    if (!(iss >> load_1m)) {
        throw ProbeUnavailable("cannot read " + (proc_root_ / "loadavg").string());
    }
    return load_1m;
}

int ProcProbe::cpu_count() {
    long count = sysconf(_SC_NPROCESSORS_ONLN);
    return count < 1 ? 1 : static_cast<int>(count);
}

size_t ProcProbe::count_zombies(const std::string& name_pattern) {
    std::regex matcher(name_pattern);
    size_t zombies = 0;
    for (pid_t pid : list_pids()) {
        auto info = read_process(pid);
        if (!info || info->state != 'Z') continue;
        if (std::regex_search(info->name, matcher)) {
            zombies++;
        }
    }
    return zombies;
}

} // namespace warden::probe
