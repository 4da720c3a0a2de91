#include "admission/admission_controller.hpp"
#include "core/config.hpp"
#include "runtime/task/registry.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace warden::admission {

const char* deny_reason_to_string(DenyReason reason) {
    switch (reason) {
        case DenyReason::NONE:                return "None";
        case DenyReason::CONCURRENCY_CEILING: return "ConcurrencyCeiling";
        case DenyReason::INSUFFICIENT_MEMORY: return "InsufficientMemory";
        case DenyReason::LOAD_CEILING:        return "LoadCeiling";
        case DenyReason::PROBE_UNAVAILABLE:   return "ProbeUnavailable";
        default: return "Unknown";
    }
}

AdmissionLimits AdmissionLimits::from_env() {
    AdmissionLimits limits;
    limits.max_concurrent = static_cast<size_t>(std::max<long>(0,
        core::config::get_env_int("WARDEN_MAX_CONCURRENT", static_cast<long>(limits.max_concurrent))));
    limits.min_free_gb = core::config::get_env_double("WARDEN_MIN_FREE_GB", limits.min_free_gb);
    limits.max_load_per_cpu = core::config::get_env_double("WARDEN_MAX_LOAD_PER_CPU", limits.max_load_per_cpu);
    return limits;
}

std::string AdmissionDecision::code() const {
    if (admitted) return "Admitted";
    return std::string("Denied:") + deny_reason_to_string(reason);
}

nlohmann::json AdmissionDecision::to_json() const {
    return nlohmann::json{
        {"admitted", admitted},
        {"code", code()},
        {"detail", detail},
        {"live_workers", live_workers},
        {"free_gb", free_gb}
    };
}

AdmissionController::AdmissionController(probe::ResourceProbe& probe,
                                         const runtime::TaskRegistry* registry)
    : probe_(probe), registry_(registry) {
}

AdmissionDecision AdmissionController::request_admission(const probe::WorkerRole& role,
                                                         const AdmissionLimits& limits) {
    AdmissionDecision decision;

    try {
        size_t live = probe_.live_worker_count(role);
        if (registry_) {
            live = std::max(live, registry_->running_count(role.name));
        }
        decision.live_workers = live;

        if (live >= limits.max_concurrent) {
            decision.reason = DenyReason::CONCURRENCY_CEILING;
            decision.detail = fmt::format("Max concurrent {} workers: {}/{}",
                role.name, live, limits.max_concurrent);
            spdlog::debug("Admission denied: {}", decision.detail);
            return decision;
        }

        double free_gb = probe_.free_memory_gb();
        decision.free_gb = free_gb;
        if (free_gb < limits.min_free_gb) {
            decision.reason = DenyReason::INSUFFICIENT_MEMORY;
            decision.detail = fmt::format("Low memory: {:.1f}GB (need {:.1f}GB)",
                free_gb, limits.min_free_gb);
            spdlog::debug("Admission denied: {}", decision.detail);
            return decision;
        }

        if (limits.max_load_per_cpu > 0.0) {
            double load = probe_.load_average();
            int cpus = probe_.cpu_count();
            if (load > limits.max_load_per_cpu * cpus) {
                decision.reason = DenyReason::LOAD_CEILING;
                decision.detail = fmt::format("High load: {:.1f} on {} cpus", load, cpus);
                spdlog::debug("Admission denied: {}", decision.detail);
                return decision;
            }
        }

        decision.admitted = true;
        decision.detail = fmt::format("OK: {} running, {:.1f}GB free", live, free_gb);
        return decision;

    } catch (const probe::ProbeUnavailable& e) {
        // Never admit blind
        decision.admitted = false;
        decision.reason = DenyReason::PROBE_UNAVAILABLE;
        decision.detail = e.what();
        spdlog::warn("Admission denied, probe unavailable: {}", e.what());
        return decision;
    }
}

AdmissionDecision AdmissionController::admit_with_backoff(
    const probe::WorkerRole& role,
    const AdmissionLimits& limits,
    Backoff& backoff,
    uint32_t max_attempts,
    const std::function<bool(std::chrono::milliseconds)>& sleep) {
    while (true) {
        auto decision = request_admission(role, limits);
        if (decision.admitted) {
            backoff.reset();
            return decision;
        }
        if (max_attempts > 0 && backoff.attempts() + 1 >= max_attempts) {
            return decision;
        }

        auto delay = backoff.next_delay();
        spdlog::info("{} for {}, retrying in {}ms", decision.code(), role.name, delay.count());
        if (!sleep(delay)) {
            return decision;
        }
    }
}

} // namespace warden::admission
