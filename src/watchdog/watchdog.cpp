#include "watchdog/watchdog.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <csignal>
#include <fstream>
#include <system_error>
#include <thread>
#include <unordered_set>

namespace warden::watchdog {

namespace {

int64_t epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // anonymous namespace

const char* check_to_string(Check check) {
    switch (check) {
        case Check::PROCESS_CEILING: return "process_ceiling";
        case Check::SESSION_PRUNING: return "session_pruning";
        case Check::RUNAWAY_BUILDS:  return "runaway_builds";
        case Check::ZOMBIES:         return "zombies";
        case Check::LIVENESS:        return "liveness";
        case Check::CRITICAL_MEMORY: return "critical_memory";
        case Check::ORPHANS:         return "orphans";
        default: return "unknown";
    }
}

nlohmann::json WatchdogAction::to_json() const {
    return nlohmann::json{
        {"check", check_to_string(check)},
        {"action", action},
        {"target", target},
        {"detail", detail}
    };
}

nlohmann::json CheckFailure::to_json() const {
    return nlohmann::json{{"check", check_to_string(check)}, {"error", error}};
}

size_t SweepReport::count(Check check, const std::string& action) const {
    return static_cast<size_t>(std::count_if(actions.begin(), actions.end(),
        [&](const WatchdogAction& a) { return a.check == check && a.action == action; }));
}

nlohmann::json SweepReport::to_json() const {
    nlohmann::json j;
    j["started_at"] = epoch_ms(started_at);
    j["protected_mode"] = protected_mode;
    j["primary_pid"] = primary_pid ? nlohmann::json(*primary_pid) : nlohmann::json(nullptr);
    j["actions"] = nlohmann::json::array();
    for (const auto& action : actions) {
        j["actions"].push_back(action.to_json());
    }
    j["failures"] = nlohmann::json::array();
    for (const auto& failure : failures) {
        j["failures"].push_back(failure.to_json());
    }
    return j;
}

Watchdog::Watchdog(WatchdogConfig config,
                   probe::ResourceProbe& probe,
                   ProcessSignaller& signaller,
                   ActionLog& action_log,
                   services::HealthProbe* health,
                   services::ServiceControl* service)
    : config_(std::move(config)),
      probe_(probe),
      signaller_(signaller),
      action_log_(action_log),
      health_(health),
      service_(service),
      flag_(config_.flag_path, config_.flag_staleness) {
}

SweepReport Watchdog::sweep() {
    SweepReport report;
    report.started_at = std::chrono::system_clock::now();

    // Read once so every check sees the same mode
    bool removed_stale = false;
    try {
        report.protected_mode = flag_.is_active(&removed_stale);
    } catch (const std::exception& e) {
        spdlog::warn("Cannot read coordination flag {}: {}", flag_.path().string(), e.what());
    }
    if (removed_stale) {
        action_log_.record("Coordination flag {} is stale, removed", flag_.path().string());
    }

    Sweep sweep{report, report.protected_mode};

    run_check(Check::PROCESS_CEILING, sweep, &Watchdog::check_process_ceiling);
    run_check(Check::SESSION_PRUNING, sweep, &Watchdog::check_session_pruning);
    run_check(Check::RUNAWAY_BUILDS, sweep, &Watchdog::check_runaway_builds);
    run_check(Check::ZOMBIES, sweep, &Watchdog::check_zombies);
    run_check(Check::LIVENESS, sweep, &Watchdog::check_liveness);
    run_check(Check::CRITICAL_MEMORY, sweep, &Watchdog::check_critical_memory);
    run_check(Check::ORPHANS, sweep, &Watchdog::check_orphans);

    spdlog::debug("Sweep done: {} actions, {} failed checks",
                  report.actions.size(), report.failures.size());
    return report;
}

void Watchdog::run() {
    spdlog::info("Watchdog running every {}s", config_.period.count());
    while (true) {
        sweep();

        std::unique_lock<std::mutex> lock(stop_mutex_);
        if (stop_cv_.wait_for(lock, config_.period, [this]() { return stopping_; })) {
            break;
        }
    }
    spdlog::info("Watchdog stopped");
}

void Watchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();
}

void Watchdog::run_check(Check check, Sweep& sweep, void (Watchdog::*fn)(Sweep&)) {
    try {
        (this->*fn)(sweep);
    } catch (const std::exception& e) {
        spdlog::error("Watchdog check {} failed: {}", check_to_string(check), e.what());
        sweep.report.failures.push_back(CheckFailure{check, e.what()});
    }
}

void Watchdog::act(Sweep& sweep, Check check, const std::string& action,
                   const std::string& target, const std::string& detail) {
    action_log_.write(detail);
    sweep.report.actions.push_back(WatchdogAction{check, action, target, detail});
}

std::optional<pid_t> Watchdog::primary_of(const std::vector<probe::ProcessInfo>& workers) {
    if (workers.empty()) {
        return std::nullopt;
    }

    if (!config_.primary_pid_file.empty()) {
        std::ifstream in(config_.primary_pid_file);
        long pid = 0;
        if (in >> pid) {
            auto it = std::find_if(workers.begin(), workers.end(),
                [pid](const probe::ProcessInfo& p) { return p.pid == pid; });
            if (it != workers.end()) {
                return it->pid;
            }
        }
    }

    // Workers arrive oldest first, ties by lowest pid
    return workers.front().pid;
}

bool Watchdog::has_worker_ancestor(pid_t pid, const std::vector<probe::ProcessInfo>& workers) {
    std::unordered_set<pid_t> worker_pids;
    for (const auto& w : workers) {
        worker_pids.insert(w.pid);
    }

    auto current = probe_.parent_of(pid);
    for (int depth = 0; depth < config_.orphan_max_depth && current; ++depth) {
        if (worker_pids.count(*current)) {
            return true;
        }
        if (*current <= 1) {
            return false;
        }
        current = probe_.parent_of(*current);
    }
    return false;
}

void Watchdog::check_process_ceiling(Sweep& sweep) {
    auto workers = probe_.list_workers(config_.worker_role);
    auto primary = primary_of(workers);
    sweep.report.primary_pid = primary;

    if (workers.size() <= config_.max_workers) {
        return;
    }

    if (sweep.protected_mode) {
        act(sweep, Check::PROCESS_CEILING, "warn", "",
            fmt::format("WARNING: {} {} processes, but protected mode is active - not killing",
                        workers.size(), config_.worker_role.name));
        return;
    }

    size_t excess = workers.size() - config_.max_workers;
    action_log_.record("WARNING: {} {} processes running (max {})",
                       workers.size(), config_.worker_role.name, config_.max_workers);

    for (const auto& worker : workers) {
        if (excess == 0) {
            break;
        }
        if (primary && worker.pid == *primary) {
            continue;
        }
        // A worker that already exited still counts toward the reduction
        signaller_.send(worker.pid, SIGTERM);
        act(sweep, Check::PROCESS_CEILING, "sigterm", std::to_string(worker.pid),
            fmt::format("Killing excess {} process: {}", config_.worker_role.name, worker.pid));
        --excess;
    }
}

void Watchdog::check_session_pruning(Sweep& sweep) {
    if (config_.session_dir.empty()) {
        return;
    }

    auto artifacts = probe_.list_artifacts_oldest_first(config_.session_dir, config_.session_pattern);
    if (artifacts.size() <= config_.max_session_files) {
        return;
    }

    size_t excess = artifacts.size() - config_.max_session_files;
    action_log_.record("Cleaning up session files: {} found, keeping {}",
                       artifacts.size(), config_.max_session_files);

    for (size_t i = 0; i < excess; ++i) {
        std::error_code ec;
        std::filesystem::remove(artifacts[i], ec);
        if (ec) {
            spdlog::warn("Cannot remove {}: {}", artifacts[i].string(), ec.message());
            continue;
        }
        act(sweep, Check::SESSION_PRUNING, "delete", artifacts[i].string(),
            fmt::format("Removed old session: {}", artifacts[i].filename().string()));
    }
}

void Watchdog::check_runaway_builds(Sweep& sweep) {
    auto limit = sweep.protected_mode ? config_.build_max_age_protected : config_.build_max_age;

    for (const auto& build : probe_.list_workers(config_.build_role)) {
        auto age = probe_.process_age(build.pid);
        if (!age) {
            continue;
        }
        if (*age > static_cast<double>(limit.count())) {
            signaller_.send(build.pid, SIGKILL);
            act(sweep, Check::RUNAWAY_BUILDS, "sigkill", std::to_string(build.pid),
                fmt::format("Killing stuck {} process: {} (running {:.0f}s, limit {}s)",
                            config_.build_role.name, build.pid, *age, limit.count()));
        }
    }
}

void Watchdog::check_zombies(Sweep& sweep) {
    size_t zombies = probe_.count_zombies(config_.zombie_pattern);
    if (zombies > 0) {
        // Only the parent can reap them
        act(sweep, Check::ZOMBIES, "warn", "",
            fmt::format("Found {} zombie {} processes", zombies, config_.zombie_pattern));
    }
}

void Watchdog::check_liveness(Sweep& sweep) {
    if (!health_ || !service_) {
        return;
    }
    if (!service_->is_active()) {
        spdlog::debug("Sibling service not active, liveness not probed");
        return;
    }

    int status = health_->check();
    if (status == 200) {
        return;
    }

    // Second opinion before restarting
    spdlog::warn("Health check returned {}, re-checking", status);
    std::this_thread::sleep_for(config_.health_recheck_delay);
    status = health_->check();
    if (status == 200) {
        return;
    }

    bool restarted = service_->restart();
    act(sweep, Check::LIVENESS, "restart", config_.health_url,
        fmt::format("CRITICAL: service unresponsive (HTTP {:03d}), restart {}",
                    status, restarted ? "issued" : "failed"));
}

void Watchdog::check_critical_memory(Sweep& sweep) {
    double free_gb = probe_.free_memory_gb();
    if (free_gb >= config_.critical_free_gb) {
        return;
    }

    action_log_.record("CRITICAL: Only {:.2f}GB RAM available", free_gb);

    // Applies in protected mode too
    auto workers = probe_.list_workers(config_.worker_role);
    auto primary = primary_of(workers);
    for (const auto& worker : workers) {
        if (primary && worker.pid == *primary) {
            continue;
        }
        signaller_.send(worker.pid, SIGKILL);
        act(sweep, Check::CRITICAL_MEMORY, "sigkill", std::to_string(worker.pid),
            fmt::format("Emergency kill of {} {} due to low memory",
                        config_.worker_role.name, worker.pid));
    }
}

void Watchdog::check_orphans(Sweep& sweep) {
    if (config_.orphan_patterns.empty()) {
        return;
    }

    auto workers = probe_.list_workers(config_.worker_role);
    std::unordered_set<pid_t> seen;

    for (const auto& pattern : config_.orphan_patterns) {
        probe::WorkerRole helpers{"helper", pattern, config_.worker_role.uid};
        for (const auto& helper : probe_.list_workers(helpers)) {
            if (!seen.insert(helper.pid).second) {
                continue;
            }
            if (helper.age_seconds <= static_cast<double>(config_.orphan_max_age.count())) {
                continue;
            }
            if (has_worker_ancestor(helper.pid, workers)) {
                continue;
            }
            signaller_.send(helper.pid, SIGKILL);
            act(sweep, Check::ORPHANS, "sigkill", std::to_string(helper.pid),
                fmt::format("Killed orphan {} (pattern '{}', age {:.0f}s)",
                            helper.pid, pattern, helper.age_seconds));
        }
    }
}

} // namespace warden::watchdog
