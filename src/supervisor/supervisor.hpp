/**
 * Warden Supervisor
 *
 * Entry point for background work. submit() only queues; a dispatcher thread
 * retries admission with backoff and spawns the worker, and a monitor thread
 * reaps exits, enforces the per-task runtime limit and reports transitions
 * to the notifier.
 *
 * A single dispatcher serializes admit + spawn + mark_running, so callers in
 * this process never overshoot the ceiling. Separate processes still can; the
 * watchdog corrects that.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "admission/admission_controller.hpp"
#include "probe/resource_probe.hpp"
#include "runtime/task/journal.hpp"
#include "runtime/task/registry.hpp"
#include "runtime/worker/process.hpp"
#include "services/notifier.hpp"
#include "supervisor/config.hpp"

namespace warden::supervisor {

class Supervisor {
public:
    Supervisor(SupervisorConfig config,
               probe::ResourceProbe& probe,
               std::shared_ptr<runtime::TaskRunner> runner,
               std::shared_ptr<services::Notifier> notifier = nullptr);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Start dispatcher and monitor threads (idempotent)
    void start();

    // Stop the threads, cancel queued tasks and terminate running workers
    void shutdown();

    // Queue a task and return its id right away. task_id empty: generated.
    // Throws DuplicateTask for a reused id, std::invalid_argument for an
    // empty prompt, std::runtime_error after shutdown.
    std::string submit(const std::string& prompt,
                       const std::string& working_directory = {},
                       bool primary = false,
                       const std::string& task_id = {});

    std::optional<runtime::TaskSnapshot> status(const std::string& id) const;

    // Drop a terminal task from memory (the journal keeps it)
    bool acknowledge(const std::string& id);

    // Queued: cancelled at once. Running: SIGTERM, reported on exit.
    bool cancel(const std::string& id);

    // Block until the task is terminal or the timeout passes
    std::optional<runtime::TaskSnapshot> wait(const std::string& id,
                                              std::chrono::milliseconds timeout);

    nlohmann::json queue_status();

    // One monitor pass; the monitor thread calls this every interval
    void poll_once();

    const SupervisorConfig& config() const { return config_; }
    runtime::TaskRegistry& registry() { return registry_; }

private:
    void dispatcher_loop();
    void monitor_loop();

    void launch(const runtime::TaskSnapshot& task);
    void enforce_timeouts();
    void stop_workers();

    // Lets a waiting dispatcher retry admission early
    void wake_dispatcher();
    void signal_state_change();

    // Primary pid file cleanup and notification for a reaped worker
    void report_exit(const runtime::TaskSnapshot& task);

    void notify_running(const runtime::TaskSnapshot& task);
    void notify_terminal(const runtime::TaskSnapshot& task);
    void notify(const std::string& id, runtime::TaskStatus status, const std::string& text);

    void write_primary_pid(pid_t pid);
    void clear_primary_pid(pid_t pid);

    SupervisorConfig config_;
    std::shared_ptr<runtime::TaskJournal> journal_;
    runtime::TaskRegistry registry_;
    admission::AdmissionController admission_;
    std::shared_ptr<runtime::TaskRunner> runner_;
    std::shared_ptr<services::Notifier> notifier_;

    // Dispatcher queue and lifecycle
    std::deque<std::string> pending_;
    std::mutex mutex_;
    std::condition_variable dispatch_cv_;
    std::condition_variable monitor_cv_;
    std::condition_variable state_cv_;
    bool capacity_freed_ = false;
    bool started_ = false;
    bool stopping_ = false;
    std::thread dispatcher_;
    std::thread monitor_;

    // Timed-out tasks that already received SIGTERM
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> timeout_signalled_;
    std::mutex monitor_mutex_;
};

} // namespace warden::supervisor
