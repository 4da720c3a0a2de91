/**
 * Warden Watchdog
 *
 * Fixed-period sweep that corrects what admission cannot prevent: worker
 * overshoot, session artifact buildup, runaway builds, an unresponsive
 * sibling service, memory exhaustion and orphaned helper processes.
 *
 * Every sweep starts from scratch. Nothing is remembered between sweeps.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "coord/coordination_flag.hpp"
#include "probe/resource_probe.hpp"
#include "services/health_check.hpp"
#include "services/service_control.hpp"
#include "watchdog/action_log.hpp"
#include "watchdog/config.hpp"
#include "watchdog/signaller.hpp"

namespace warden::watchdog {

// Sweep checks, in execution order
enum class Check {
    PROCESS_CEILING,
    SESSION_PRUNING,
    RUNAWAY_BUILDS,
    ZOMBIES,
    LIVENESS,
    CRITICAL_MEMORY,
    ORPHANS
};

const char* check_to_string(Check check);

struct WatchdogAction {
    Check check;
    std::string action;                 // "sigterm", "sigkill", "delete", "restart", "warn"
    std::string target;                 // pid or path, empty for warnings
    std::string detail;

    nlohmann::json to_json() const;
};

struct CheckFailure {
    Check check;
    std::string error;

    nlohmann::json to_json() const;
};

struct SweepReport {
    std::chrono::system_clock::time_point started_at;
    bool protected_mode = false;
    std::optional<pid_t> primary_pid;
    std::vector<WatchdogAction> actions;
    std::vector<CheckFailure> failures;

    size_t count(Check check, const std::string& action) const;
    nlohmann::json to_json() const;
};

class Watchdog {
public:
    // health and service are optional; the liveness check is skipped
    // when either is missing.
    Watchdog(WatchdogConfig config,
             probe::ResourceProbe& probe,
             ProcessSignaller& signaller,
             ActionLog& action_log,
             services::HealthProbe* health = nullptr,
             services::ServiceControl* service = nullptr);

    // Run all checks once
    SweepReport sweep();

    // Sweep every period until stop()
    void run();
    void stop();

    const WatchdogConfig& config() const { return config_; }

private:
    // Per-sweep context shared by the checks
    struct Sweep {
        SweepReport& report;
        bool protected_mode;
    };

    void check_process_ceiling(Sweep& sweep);
    void check_session_pruning(Sweep& sweep);
    void check_runaway_builds(Sweep& sweep);
    void check_zombies(Sweep& sweep);
    void check_liveness(Sweep& sweep);
    void check_critical_memory(Sweep& sweep);
    void check_orphans(Sweep& sweep);

    void run_check(Check check, Sweep& sweep, void (Watchdog::*fn)(Sweep&));

    std::optional<pid_t> primary_of(const std::vector<probe::ProcessInfo>& workers);
    bool has_worker_ancestor(pid_t pid, const std::vector<probe::ProcessInfo>& workers);

    void act(Sweep& sweep, Check check, const std::string& action,
             const std::string& target, const std::string& detail);

    WatchdogConfig config_;
    probe::ResourceProbe& probe_;
    ProcessSignaller& signaller_;
    ActionLog& action_log_;
    services::HealthProbe* health_;
    services::ServiceControl* service_;
    coord::CoordinationFlag flag_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stopping_ = false;
};

} // namespace warden::watchdog
