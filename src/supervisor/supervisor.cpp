#include "supervisor/supervisor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace warden::supervisor {

using runtime::TaskSnapshot;
using runtime::TaskStatus;

Supervisor::Supervisor(SupervisorConfig config,
                       probe::ResourceProbe& probe,
                       std::shared_ptr<runtime::TaskRunner> runner,
                       std::shared_ptr<services::Notifier> notifier)
    : config_(std::move(config)),
      journal_(config_.task_dir.empty() ? nullptr
                                        : std::make_shared<runtime::TaskJournal>(config_.task_dir)),
      registry_(journal_),
      admission_(probe, &registry_),
      runner_(std::move(runner)),
      notifier_(std::move(notifier)) {
    if (!runner_) {
        throw std::invalid_argument("supervisor needs a task runner");
    }
    spdlog::debug("Supervisor initialized (role={}, max_concurrent={}, min_free_gb={})",
                  config_.role.name, config_.limits.max_concurrent, config_.limits.min_free_gb);
}

Supervisor::~Supervisor() {
    shutdown();
}

void Supervisor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || stopping_) {
        return;
    }
    started_ = true;
    dispatcher_ = std::thread([this]() { dispatcher_loop(); });
    monitor_ = std::thread([this]() { monitor_loop(); });
    spdlog::info("Supervisor started");
}

void Supervisor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    dispatch_cv_.notify_all();
    monitor_cv_.notify_all();

    if (dispatcher_.joinable()) dispatcher_.join();
    if (monitor_.joinable()) monitor_.join();

    stop_workers();
    signal_state_change();
    spdlog::info("Supervisor stopped");
}

void Supervisor::stop_workers() {
    for (const auto& task : registry_.list()) {
        if (!runtime::is_terminal(task.status)) {
            registry_.terminate(task.id, TaskStatus::CANCELLED, false);
        }
        if (task.status == TaskStatus::QUEUED) {
            if (auto after = registry_.get(task.id)) notify_terminal(*after);
        }
    }

    // Graceful first, then SIGKILL whatever is left
    auto deadline = std::chrono::steady_clock::now() + config_.kill_grace;
    while (registry_.count(TaskStatus::RUNNING) > 0 && std::chrono::steady_clock::now() < deadline) {
        for (const auto& task : registry_.poll_exits()) {
            report_exit(task);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    for (const auto& task : registry_.list()) {
        if (task.status == TaskStatus::RUNNING) {
            spdlog::warn("Task {} ignored SIGTERM, killing pid {}", task.id, task.pid);
            registry_.terminate(task.id, TaskStatus::CANCELLED, true);
        }
    }
    for (int i = 0; i < 20 && registry_.count(TaskStatus::RUNNING) > 0; ++i) {
        for (const auto& task : registry_.poll_exits()) {
            report_exit(task);
        }
        if (registry_.count(TaskStatus::RUNNING) > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
}

std::string Supervisor::submit(const std::string& prompt,
                               const std::string& working_directory,
                               bool primary,
                               const std::string& task_id) {
    if (prompt.empty()) {
        throw std::invalid_argument("empty prompt");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("supervisor is shutting down");
        }
    }

    TaskSnapshot task;
    task.role = config_.role.name;
    task.prompt = prompt;
    task.working_directory = working_directory;
    task.primary = primary;

    if (!task_id.empty()) {
        task.id = task_id;
        registry_.register_task(task);
    } else {
        // Generated ids collide only by bad luck
        for (int attempt = 0;; ++attempt) {
            task.id = runtime::generate_task_id();
            try {
                registry_.register_task(task);
                break;
            } catch (const runtime::DuplicateTask&) {
                if (attempt >= 3) throw;
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(task.id);
    }
    dispatch_cv_.notify_all();

    spdlog::info("Task {} queued{}", task.id, primary ? " (primary)" : "");
    return task.id;
}

std::optional<TaskSnapshot> Supervisor::status(const std::string& id) const {
    return registry_.get(id);
}

bool Supervisor::acknowledge(const std::string& id) {
    return registry_.acknowledge(id);
}

bool Supervisor::cancel(const std::string& id) {
    auto task = registry_.get(id);
    if (!task || runtime::is_terminal(task->status)) {
        return false;
    }
    if (!registry_.terminate(id, TaskStatus::CANCELLED, false)) {
        return false;
    }

    spdlog::info("Task {} cancel requested", id);
    auto after = registry_.get(id);
    if (after && after->status == TaskStatus::CANCELLED) {
        // Was still queued; running tasks are reported when they exit
        notify_terminal(*after);
        signal_state_change();
        wake_dispatcher();
    }
    return true;
}

std::optional<TaskSnapshot> Supervisor::wait(const std::string& id,
                                             std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        auto task = registry_.get(id);
        if (!task || runtime::is_terminal(task->status)) {
            return task;
        }
        if (state_cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            return registry_.get(id);
        }
    }
}

nlohmann::json Supervisor::queue_status() {
    nlohmann::json j;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        j["dispatcher_running"] = started_ && !stopping_;
        j["pending"] = pending_.size();
    }
    j["queued"] = registry_.count(TaskStatus::QUEUED);
    j["running"] = registry_.count(TaskStatus::RUNNING);
    j["completed"] = registry_.count(TaskStatus::COMPLETED);
    j["failed"] = registry_.count(TaskStatus::FAILED);
    j["timed_out"] = registry_.count(TaskStatus::TIMED_OUT);
    j["cancelled"] = registry_.count(TaskStatus::CANCELLED);

    auto decision = admission_.request_admission(config_.role, config_.limits);
    j["can_spawn"] = decision.admitted;
    j["admission"] = decision.to_json();
    j["limits"] = {
        {"max_concurrent", config_.limits.max_concurrent},
        {"min_free_gb", config_.limits.min_free_gb},
        {"max_load_per_cpu", config_.limits.max_load_per_cpu}
    };
    return j;
}

void Supervisor::dispatcher_loop() {
    admission::Backoff backoff(config_.backoff);

    while (true) {
        std::string id;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            dispatch_cv_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
            if (stopping_) {
                return;
            }
            id = pending_.front();
            capacity_freed_ = false;
        }

        auto still_queued = [this, &id]() {
            auto task = registry_.get(id);
            return task && task->status == TaskStatus::QUEUED;
        };

        admission::AdmissionDecision decision;
        if (still_queued()) {
            backoff.reset();
            decision = admission_.admit_with_backoff(config_.role, config_.limits, backoff,
                config_.max_admission_attempts,
                [this, &still_queued](std::chrono::milliseconds delay) {
                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        dispatch_cv_.wait_for(lock, delay,
                            [this]() { return stopping_ || capacity_freed_; });
                        capacity_freed_ = false;
                        if (stopping_) return false;
                    }
                    return still_queued();
                });
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
            auto it = std::find(pending_.begin(), pending_.end(), id);
            if (it != pending_.end()) {
                pending_.erase(it);
            }
        }

        auto task = registry_.get(id);
        if (!task || task->status != TaskStatus::QUEUED) {
            // Cancelled while waiting for admission
            continue;
        }

        if (!decision.admitted) {
            runtime::ExitInfo info;
            info.error = decision.code() + ": " + decision.detail;
            spdlog::warn("Task {} gave up on admission after {} attempts ({})",
                         id, backoff.attempts() + 1, info.error);
            if (registry_.mark_terminal(id, TaskStatus::FAILED, info)) {
                if (auto failed = registry_.get(id)) notify_terminal(*failed);
                signal_state_change();
            }
            continue;
        }

        try {
            launch(*task);
        } catch (const std::exception& e) {
            spdlog::error("Task {} launch failed: {}", id, e.what());
        }
    }
}

void Supervisor::launch(const TaskSnapshot& task) {
    runtime::WorkerSpec spec;
    spec.task_id = task.id;
    spec.prompt = task.prompt;
    spec.working_directory = task.working_directory;
    if (journal_) {
        spec.output_path = journal_->output_path(task.id);
    }

    std::unique_ptr<runtime::WorkerHandle> handle;
    try {
        handle = runner_->spawn(spec);
    } catch (const runtime::SpawnError& e) {
        spdlog::error("Task {} failed to spawn: {}", task.id, e.what());
        runtime::ExitInfo info;
        info.error = e.what();
        if (registry_.mark_terminal(task.id, TaskStatus::FAILED, info)) {
            if (auto failed = registry_.get(task.id)) notify_terminal(*failed);
            signal_state_change();
        }
        return;
    }

    if (!registry_.mark_running(task.id, std::move(handle))) {
        return;
    }

    auto running = registry_.get(task.id);
    if (!running) {
        return;
    }
    if (running->primary) {
        write_primary_pid(running->pid);
    }
    notify_running(*running);
    signal_state_change();
}

void Supervisor::monitor_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (monitor_cv_.wait_for(lock, config_.monitor_interval, [this]() { return stopping_; })) {
                return;
            }
        }
        try {
            poll_once();
        } catch (const std::exception& e) {
            spdlog::error("Supervisor monitor pass failed: {}", e.what());
        }
    }
}

void Supervisor::poll_once() {
    std::lock_guard<std::mutex> lock(monitor_mutex_);

    auto finished = registry_.poll_exits();
    for (const auto& task : finished) {
        timeout_signalled_.erase(task.id);
        report_exit(task);
    }

    enforce_timeouts();

    if (!finished.empty()) {
        wake_dispatcher();
        signal_state_change();
    }
}

void Supervisor::report_exit(const TaskSnapshot& task) {
    if (task.primary) {
        clear_primary_pid(task.pid);
    }
    notify_terminal(task);
}

void Supervisor::enforce_timeouts() {
    if (config_.task_timeout.count() == 0) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto steady_now = std::chrono::steady_clock::now();

    for (const auto& task : registry_.list()) {
        if (task.status != TaskStatus::RUNNING || !task.started_at) continue;
        if (now - *task.started_at <= config_.task_timeout) continue;

        auto it = timeout_signalled_.find(task.id);
        if (it == timeout_signalled_.end()) {
            spdlog::warn("Task {} exceeded {}s, terminating pid {}",
                         task.id, config_.task_timeout.count(), task.pid);
            registry_.terminate(task.id, TaskStatus::TIMED_OUT, false);
            timeout_signalled_[task.id] = steady_now;
        } else if (steady_now - it->second >= config_.kill_grace) {
            spdlog::warn("Task {} still alive {}s after SIGTERM, killing pid {}",
                         task.id, config_.kill_grace.count(), task.pid);
            registry_.terminate(task.id, TaskStatus::TIMED_OUT, true);
        }
    }
}

void Supervisor::wake_dispatcher() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        capacity_freed_ = true;
    }
    dispatch_cv_.notify_all();
}

void Supervisor::signal_state_change() {
    // Taking the lock orders this against a waiter between get() and wait
    { std::lock_guard<std::mutex> lock(mutex_); }
    state_cv_.notify_all();
}

void Supervisor::notify_running(const TaskSnapshot& task) {
    notify(task.id, TaskStatus::RUNNING, fmt::format("started (pid {})", task.pid));
}

void Supervisor::notify_terminal(const TaskSnapshot& task) {
    std::string text = runtime::task_status_to_string(task.status);
    if (task.exit_info) {
        const auto& exit_info = *task.exit_info;
        if (!exit_info.error.empty()) {
            text += ": " + exit_info.error;
        } else if (exit_info.signal != 0) {
            text += fmt::format(" (signal {})", exit_info.signal);
        } else {
            text += fmt::format(" (exit {})", exit_info.exit_code);
        }
    }
    notify(task.id, task.status, text);
}

void Supervisor::notify(const std::string& id, TaskStatus status, const std::string& text) {
    if (!notifier_) {
        return;
    }
    try {
        notifier_->notify(id, status, text);
    } catch (const std::exception& e) {
        spdlog::warn("Notifier failed for task {}: {}", id, e.what());
    }
}

void Supervisor::write_primary_pid(pid_t pid) {
    if (config_.primary_pid_file.empty()) {
        return;
    }
    std::error_code ec;
    if (config_.primary_pid_file.has_parent_path()) {
        std::filesystem::create_directories(config_.primary_pid_file.parent_path(), ec);
    }
    std::ofstream out(config_.primary_pid_file, std::ios::trunc);
    out << pid << "\n";
    if (!out) {
        spdlog::warn("Cannot write primary pid file {}", config_.primary_pid_file.string());
    }
}

void Supervisor::clear_primary_pid(pid_t pid) {
    if (config_.primary_pid_file.empty()) {
        return;
    }
    long recorded = 0;
    {
        std::ifstream in(config_.primary_pid_file);
        if (!(in >> recorded) || recorded != pid) {
            return;
        }
    }
    std::error_code ec;
    std::filesystem::remove(config_.primary_pid_file, ec);
}

} // namespace warden::supervisor
