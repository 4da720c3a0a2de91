#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <unistd.h>
#include "coord/coordination_flag.hpp"
#include "probe/resource_probe.hpp"

namespace warden::watchdog {

// Watchdog configuration
struct WatchdogConfig {
    // Process ceiling. Only our own user's workers are counted or killed.
    probe::WorkerRole worker_role{"claude", "^claude", getuid()};
    size_t max_workers = 6;
    std::filesystem::path primary_pid_file;       // Empty: oldest worker is primary

    // Session artifacts
    std::filesystem::path session_dir;            // Empty disables pruning
    std::string session_pattern = "*.jsonl";
    size_t max_session_files = 20;

    // Runaway builds
    probe::WorkerRole build_role{"build", "npx tsc", getuid()};
    std::chrono::seconds build_max_age{300};
    std::chrono::seconds build_max_age_protected{600};

    // Zombies (log only)
    std::string zombie_pattern = "node";

    // Sibling service liveness
    std::string health_url = "http://localhost:3100/health";   // Empty disables
    std::chrono::milliseconds health_timeout{5000};
    std::chrono::milliseconds health_recheck_delay{3000};
    std::vector<std::string> service_active_command = {
        "systemctl", "is-active", "--quiet", "claudius-api.service"};
    std::vector<std::string> service_restart_command = {
        "systemctl", "restart", "claudius-api.service"};

    // Memory pressure
    double critical_free_gb = 2.0;

    // Orphaned helpers of dead workers
    std::vector<std::string> orphan_patterns = {
        "context7-mcp", "mcp-server-supabase", "workspace-mcp", "chrome-devtools-mcp",
        "mcp-server-playwright", "stripe/mcp", "tsx mcp/servers"};
    std::chrono::seconds orphan_max_age{300};
    int orphan_max_depth = 10;

    // Coordination with protected jobs
    std::filesystem::path flag_path = "/tmp/night-watch-active";
    std::chrono::seconds flag_staleness = coord::kDefaultStaleness;

    std::filesystem::path action_log;             // Empty: console only
    std::chrono::seconds period{60};

    // WARDEN_* overrides on top of the defaults
    static WatchdogConfig from_env();
};

} // namespace warden::watchdog
