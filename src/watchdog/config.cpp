#include "watchdog/config.hpp"
#include "core/config.hpp"
#include "core/paths.hpp"
#include <algorithm>
#include <sstream>

namespace warden::watchdog {

namespace {

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto start = item.find_first_not_of(" \t");
        auto end = item.find_last_not_of(" \t");
        if (start != std::string::npos) {
            out.push_back(item.substr(start, end - start + 1));
        }
    }
    return out;
}

size_t get_env_size(const std::string& key, size_t fallback) {
    return static_cast<size_t>(std::max<long>(0,
        core::config::get_env_int(key, static_cast<long>(fallback))));
}

} // anonymous namespace

WatchdogConfig WatchdogConfig::from_env() {
    using core::config::get_env;
    using core::config::get_env_double;
    using core::config::get_env_int;
    using core::config::get_env_or;

    WatchdogConfig config;

    config.worker_role.pattern = get_env_or("WARDEN_WORKER_PATTERN", config.worker_role.pattern);
    // Negative matches every owner
    long uid = get_env_int("WARDEN_WORKER_UID", static_cast<long>(getuid()));
    std::optional<uid_t> owner;
    if (uid >= 0) {
        owner = static_cast<uid_t>(uid);
    }
    config.worker_role.uid = owner;
    config.build_role.uid = owner;
    config.max_workers = get_env_size("WARDEN_MAX_WORKERS", config.max_workers);
    config.primary_pid_file = get_env_or("WARDEN_PRIMARY_PID_FILE",
                                         (core::paths::state_dir() / "primary.pid").string());

    config.session_dir = get_env("WARDEN_SESSION_DIR");
    config.session_pattern = get_env_or("WARDEN_SESSION_PATTERN", config.session_pattern);
    config.max_session_files = get_env_size("WARDEN_MAX_SESSION_FILES", config.max_session_files);

    config.build_role.pattern = get_env_or("WARDEN_BUILD_PATTERN", config.build_role.pattern);
    config.build_max_age = std::chrono::seconds(
        get_env_int("WARDEN_BUILD_MAX_SEC", config.build_max_age.count()));
    config.build_max_age_protected = std::chrono::seconds(
        get_env_int("WARDEN_BUILD_MAX_PROTECTED_SEC", config.build_max_age_protected.count()));

    config.zombie_pattern = get_env_or("WARDEN_ZOMBIE_PATTERN", config.zombie_pattern);

    config.health_url = get_env_or("WARDEN_HEALTH_URL", config.health_url);
    config.health_timeout = std::chrono::milliseconds(static_cast<long>(
        get_env_double("WARDEN_HEALTH_TIMEOUT_SEC", config.health_timeout.count() / 1000.0) * 1000));
    config.health_recheck_delay = std::chrono::milliseconds(static_cast<long>(
        get_env_double("WARDEN_HEALTH_RECHECK_SEC", config.health_recheck_delay.count() / 1000.0) * 1000));
    if (auto cmd = get_env("WARDEN_SERVICE_ACTIVE_CMD"); !cmd.empty()) {
        config.service_active_command = core::config::split_command(cmd);
    }
    if (auto cmd = get_env("WARDEN_SERVICE_RESTART_CMD"); !cmd.empty()) {
        config.service_restart_command = core::config::split_command(cmd);
    }

    config.critical_free_gb = get_env_double("WARDEN_CRITICAL_FREE_GB", config.critical_free_gb);

    if (auto patterns = get_env("WARDEN_ORPHAN_PATTERNS"); !patterns.empty()) {
        config.orphan_patterns = split_list(patterns);
    }
    config.orphan_max_age = std::chrono::seconds(
        get_env_int("WARDEN_ORPHAN_MAX_AGE_SEC", config.orphan_max_age.count()));

    config.flag_path = get_env_or("WARDEN_FLAG_PATH", config.flag_path.string());
    config.flag_staleness = std::chrono::seconds(
        get_env_int("WARDEN_FLAG_STALE_SEC", config.flag_staleness.count()));

    config.action_log = get_env_or("WARDEN_ACTION_LOG",
                                   (core::paths::state_dir() / "watchdog.log").string());
    config.period = std::chrono::seconds(
        std::max<long>(1, get_env_int("WARDEN_SWEEP_PERIOD_SEC", config.period.count())));

    return config;
}

} // namespace warden::watchdog
