/**
 * Warden Resource Probe
 *
 * Read-only, point-in-time samples of host state taken from /proc.
 * No consistency holds between two calls: a process reported live may be
 * gone a microsecond later, and callers must tolerate that.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>

namespace warden::probe {

// A value could not be sampled at all (e.g. /proc unreadable).
class ProbeUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Processes belonging to a worker role, e.g. {"claude", "^claude"}.
 * pattern is an ECMAScript regex searched in the space-joined cmdline.
 */
struct WorkerRole {
    std::string name;
    std::string pattern;
    std::optional<uid_t> uid;               // Only processes owned by this uid

    nlohmann::json to_json() const;
};

struct ProcessInfo {
    pid_t pid = 0;
    pid_t ppid = 0;
    char state = '?';                       // R, S, D, Z, T ...
    uid_t uid = 0;
    uint64_t start_ticks = 0;               // Clock ticks after boot
    double age_seconds = 0.0;
    std::string name;                       // comm
    std::string cmdline;

    nlohmann::json to_json() const;
};

class ResourceProbe {
public:
    virtual ~ResourceProbe() = default;

    // Live (non-zombie) processes of the role, oldest first, ties by pid.
    virtual std::vector<ProcessInfo> list_workers(const WorkerRole& role) = 0;

    size_t live_worker_count(const WorkerRole& role) { return list_workers(role).size(); }

    // Seconds since the process started; nullopt if it has exited.
    virtual std::optional<double> process_age(pid_t pid) = 0;

    // Parent pid; nullopt if the process has exited.
    virtual std::optional<pid_t> parent_of(pid_t pid) = 0;

    // MemAvailable in GiB, sampled now.
    virtual double free_memory_gb() = 0;

    // 1 minute load average.
    virtual double load_average() = 0;

    virtual int cpu_count() = 0;

    // Defunct processes whose name matches name_pattern.
    virtual size_t count_zombies(const std::string& name_pattern) = 0;

    // Regular files in directory matching a glob (e.g. "*.jsonl"), oldest
    // modification time first. A missing directory yields an empty list.
    std::vector<std::filesystem::path> list_artifacts_oldest_first(
        const std::filesystem::path& directory, const std::string& pattern) const;

    size_t stale_artifact_count(const std::filesystem::path& directory,
                                const std::string& pattern) const {
        return list_artifacts_oldest_first(directory, pattern).size();
    }
};

/**
 * /proc backed probe. proc_root is overridable for tests and for reading a
 * host /proc mounted into a container.
 */
class ProcProbe : public ResourceProbe {
public:
    explicit ProcProbe(std::filesystem::path proc_root = "/proc");

    std::vector<ProcessInfo> list_workers(const WorkerRole& role) override;
    std::optional<double> process_age(pid_t pid) override;
    std::optional<pid_t> parent_of(pid_t pid) override;
    double free_memory_gb() override;
    double load_average() override;
    int cpu_count() override;
    size_t count_zombies(const std::string& name_pattern) override;

    // Full sample of one process; nullopt if it has exited.
    std::optional<ProcessInfo> read_process(pid_t pid);

private:
    std::filesystem::path proc_root_;
    long ticks_per_sec_;

    std::vector<pid_t> list_pids();
    double uptime_seconds();

    std::string read_file(const std::filesystem::path& path);
    std::vector<std::string> read_file_lines(const std::filesystem::path& path);
};

} // namespace warden::probe
