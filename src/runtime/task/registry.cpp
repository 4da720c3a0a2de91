#include "runtime/task/registry.hpp"
#include <spdlog/spdlog.h>

namespace warden::runtime {

TaskRegistry::TaskRegistry(std::shared_ptr<TaskJournal> journal)
    : journal_(std::move(journal)) {
}

void TaskRegistry::register_task(TaskSnapshot task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.count(task.id)) {
        throw DuplicateTask(task.id);
    }

    task.status = TaskStatus::QUEUED;
    if (task.created_at == std::chrono::system_clock::time_point{}) {
        task.created_at = std::chrono::system_clock::now();
    }

    std::string id = task.id;
    Task entry;
    entry.info = std::move(task);
    tasks_.emplace(id, std::move(entry));
    spdlog::debug("Task {} registered", id);
}

bool TaskRegistry::mark_running(const std::string& id, std::unique_ptr<WorkerHandle> handle) {
    if (!handle) {
        throw std::invalid_argument("mark_running without a worker handle: " + id);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it != tasks_.end() && it->second.info.status == TaskStatus::QUEUED && !it->second.handle) {
            auto& task = it->second;
            task.info.status = TaskStatus::RUNNING;
            task.info.started_at = std::chrono::system_clock::now();
            task.info.pid = handle->pid();
            task.handle = std::move(handle);
            spdlog::info("Task {} running (pid={})", id, task.info.pid);
            return true;
        }
    }

    // Nobody owns this worker and it has done no work yet: kill and reap it
    // outside the registry lock. SIGTERM could be ignored and block the caller.
    spdlog::warn("Task {} is not queued, killing its new worker (pid={})", id, handle->pid());
    handle->kill();
    handle->wait();
    return false;
}

void TaskRegistry::finish_locked(Task& task, TaskStatus status, ExitInfo exit_info) {
    if (exit_info.finished_at == std::chrono::system_clock::time_point{}) {
        exit_info.finished_at = std::chrono::system_clock::now();
    }
    task.info.status = status;
    task.info.exit_info = std::move(exit_info);
    task.handle.reset();
    task.termination_reason.reset();

    spdlog::info("Task {} {} (exit_code={}, signal={})", task.info.id,
        task_status_to_string(status), task.info.exit_info->exit_code,
        task.info.exit_info->signal);

    if (journal_) {
        journal_->save(task.info);
    }
}

bool TaskRegistry::mark_terminal(const std::string& id, TaskStatus status, ExitInfo exit_info) {
    if (!is_terminal(status)) {
        throw std::invalid_argument(std::string("not a terminal status: ") + task_status_to_string(status));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return false;
    }
    if (is_terminal(it->second.info.status)) {
        spdlog::debug("Task {} already {}, ignoring duplicate exit", id,
            task_status_to_string(it->second.info.status));
        return false;
    }

    finish_locked(it->second, status, std::move(exit_info));
    return true;
}

std::optional<TaskSnapshot> TaskRegistry::get(const std::string& id) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it != tasks_.end()) {
            return it->second.info;
        }
    }
    if (journal_) {
        return journal_->load(id);
    }
    return std::nullopt;
}

bool TaskRegistry::acknowledge(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() || !is_terminal(it->second.info.status)) {
        return false;
    }
    tasks_.erase(it);
    spdlog::debug("Task {} acknowledged", id);
    return true;
}

bool TaskRegistry::terminate(const std::string& id, TaskStatus reason, bool immediate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() || is_terminal(it->second.info.status)) {
        return false;
    }

    auto& task = it->second;
    if (task.info.status == TaskStatus::QUEUED) {
        ExitInfo info;
        info.error = std::string("terminated while queued: ") + task_status_to_string(reason);
        finish_locked(task, reason, std::move(info));
        return true;
    }

    task.termination_reason = reason;
    if (task.handle) {
        if (immediate) {
            task.handle->kill();
        } else {
            task.handle->terminate();
        }
    }
    return true;
}

std::vector<TaskSnapshot> TaskRegistry::poll_exits() {
    std::vector<TaskSnapshot> finished;
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& [id, task] : tasks_) {
        if (task.info.status != TaskStatus::RUNNING || !task.handle) continue;
        if (task.handle->is_alive()) continue;

        ExitInfo info = task.handle->wait();
        TaskStatus status;
        if (task.termination_reason) {
            status = *task.termination_reason;
        } else {
            status = info.success() ? TaskStatus::COMPLETED : TaskStatus::FAILED;
        }
        finish_locked(task, status, std::move(info));
        finished.push_back(task.info);
    }
    return finished;
}

std::vector<TaskSnapshot> TaskRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskSnapshot> result;
    result.reserve(tasks_.size());
    for (const auto& [_, task] : tasks_) {
        result.push_back(task.info);
    }
    return result;
}

size_t TaskRegistry::count(TaskStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [_, task] : tasks_) {
        if (task.info.status == status) n++;
    }
    return n;
}

size_t TaskRegistry::running_count(const std::string& role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [_, task] : tasks_) {
        if (task.info.status == TaskStatus::RUNNING && task.info.role == role) n++;
    }
    return n;
}

std::optional<pid_t> TaskRegistry::primary_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [_, task] : tasks_) {
        if (task.info.primary && task.info.status == TaskStatus::RUNNING && task.info.pid > 0) {
            return task.info.pid;
        }
    }
    return std::nullopt;
}

} // namespace warden::runtime
