/**
 * Warden Admission Controller
 *
 * Decides whether one more worker of a role may start right now. The
 * controller keeps no state between calls and hands out no leases: callers
 * that are denied retry with backoff, and a burst of simultaneous callers
 * may overshoot the ceiling slightly until the watchdog corrects it.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include "admission/backoff.hpp"
#include "probe/resource_probe.hpp"

namespace warden::runtime {
class TaskRegistry;
}

namespace warden::admission {

enum class DenyReason {
    NONE,
    CONCURRENCY_CEILING,
    INSUFFICIENT_MEMORY,
    LOAD_CEILING,
    PROBE_UNAVAILABLE
};

// "ConcurrencyCeiling", "InsufficientMemory", ...
const char* deny_reason_to_string(DenyReason reason);

struct AdmissionLimits {
    size_t max_concurrent = 2;          // Heavyweight background agents
    double min_free_gb = 4.0;
    double max_load_per_cpu = 0.0;      // 0 disables the load check

    // WARDEN_MAX_CONCURRENT, WARDEN_MIN_FREE_GB, WARDEN_MAX_LOAD_PER_CPU
    static AdmissionLimits from_env();
};

struct AdmissionDecision {
    bool admitted = false;
    DenyReason reason = DenyReason::NONE;
    std::string detail;
    size_t live_workers = 0;
    double free_gb = 0.0;

    // "Admitted" or "Denied:<Reason>"
    std::string code() const;
    nlohmann::json to_json() const;
};

class AdmissionController {
public:
    // registry, when given, contributes the running tasks it knows about:
    // a freshly spawned worker may not be visible in /proc matching yet.
    explicit AdmissionController(probe::ResourceProbe& probe,
                                 const runtime::TaskRegistry* registry = nullptr);

    AdmissionDecision request_admission(const probe::WorkerRole& role,
                                        const AdmissionLimits& limits);

    // Caller-side retry loop. sleep(delay) returns false to give up early
    // (e.g. on shutdown). max_attempts 0 retries forever.
    AdmissionDecision admit_with_backoff(const probe::WorkerRole& role,
                                         const AdmissionLimits& limits,
                                         Backoff& backoff,
                                         uint32_t max_attempts,
                                         const std::function<bool(std::chrono::milliseconds)>& sleep);

private:
    probe::ResourceProbe& probe_;
    const runtime::TaskRegistry* registry_;
};

} // namespace warden::admission
