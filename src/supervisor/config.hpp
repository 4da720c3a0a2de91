#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <unistd.h>
#include "admission/admission_controller.hpp"
#include "admission/backoff.hpp"
#include "probe/resource_probe.hpp"

namespace warden::supervisor {

// Supervisor configuration
struct SupervisorConfig {
    probe::WorkerRole role{"claude", "^claude", getuid()};
    admission::AdmissionLimits limits;
    admission::BackoffConfig backoff;
    uint32_t max_admission_attempts = 0;            // 0: keep retrying until cancelled
    std::chrono::seconds task_timeout{3600};        // 0 disables
    std::chrono::seconds kill_grace{10};            // SIGTERM -> SIGKILL on timeout
    std::chrono::milliseconds monitor_interval{500};
    std::filesystem::path task_dir;                 // Journal + worker output; empty disables
    std::filesystem::path primary_pid_file;         // Written while a primary task runs

    // WARDEN_* overrides on top of the defaults
    static SupervisorConfig from_env();
};

} // namespace warden::supervisor
