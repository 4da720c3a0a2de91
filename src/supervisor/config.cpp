#include "supervisor/config.hpp"
#include "core/config.hpp"
#include "core/paths.hpp"
#include <algorithm>

namespace warden::supervisor {

SupervisorConfig SupervisorConfig::from_env() {
    using core::config::get_env_int;
    using core::config::get_env_or;

    SupervisorConfig config;
    config.role.pattern = get_env_or("WARDEN_WORKER_PATTERN", config.role.pattern);
    // Negative matches every owner
    long uid = get_env_int("WARDEN_WORKER_UID", static_cast<long>(getuid()));
    if (uid >= 0) {
        config.role.uid = static_cast<uid_t>(uid);
    } else {
        config.role.uid.reset();
    }
    config.limits = admission::AdmissionLimits::from_env();

    config.backoff.initial_ms = static_cast<uint32_t>(std::max<long>(1,
        get_env_int("WARDEN_BACKOFF_INITIAL_MS", config.backoff.initial_ms)));
    config.backoff.max_ms = static_cast<uint32_t>(std::max<long>(config.backoff.initial_ms,
        get_env_int("WARDEN_BACKOFF_MAX_MS", config.backoff.max_ms)));
    config.max_admission_attempts = static_cast<uint32_t>(std::max<long>(0,
        get_env_int("WARDEN_ADMISSION_ATTEMPTS", config.max_admission_attempts)));

    config.task_timeout = std::chrono::seconds(std::max<long>(0,
        get_env_int("WARDEN_TASK_TIMEOUT_SEC", config.task_timeout.count())));
    config.kill_grace = std::chrono::seconds(std::max<long>(0,
        get_env_int("WARDEN_KILL_GRACE_SEC", config.kill_grace.count())));

    config.task_dir = get_env_or("WARDEN_TASK_DIR", (core::paths::state_dir() / "tasks").string());
    config.primary_pid_file = get_env_or("WARDEN_PRIMARY_PID_FILE",
                                         (core::paths::state_dir() / "primary.pid").string());
    return config;
}

} // namespace warden::supervisor
