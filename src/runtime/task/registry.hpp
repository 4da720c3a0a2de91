#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "runtime/task/journal.hpp"
#include "runtime/task/types.hpp"
#include "runtime/worker/process.hpp"

namespace warden::runtime {

// The same task id was registered twice
class DuplicateTask : public std::logic_error {
public:
    explicit DuplicateTask(const std::string& id)
        : std::logic_error("duplicate task id: " + id), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

// Task registry - owns the worker handle of every running task
class TaskRegistry {
public:
    // journal may be null: terminal tasks are then forgotten on acknowledge
    explicit TaskRegistry(std::shared_ptr<TaskJournal> journal = nullptr);

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    // Add a QUEUED task. Throws DuplicateTask if the id is present.
    void register_task(TaskSnapshot task);

    // QUEUED -> RUNNING. Returns false (and terminates the handle) when the
    // task is unknown or no longer queued, e.g. cancelled while spawning.
    bool mark_running(const std::string& id, std::unique_ptr<WorkerHandle> handle);

    // Move to a terminal status and release the handle. No-op (false) when
    // already terminal or unknown.
    bool mark_terminal(const std::string& id, TaskStatus status, ExitInfo exit_info);

    // Memory first, then the journal
    std::optional<TaskSnapshot> get(const std::string& id) const;

    // Remove a terminal task. False if unknown or still active.
    bool acknowledge(const std::string& id);

    // Signal a running task (reason recorded for its terminal status) or
    // finish a queued one right away. False if unknown or terminal.
    bool terminate(const std::string& id, TaskStatus reason, bool immediate);

    // Collect exited workers and move their tasks to a terminal status.
    // Returns the tasks that changed.
    std::vector<TaskSnapshot> poll_exits();

    std::vector<TaskSnapshot> list() const;
    size_t count(TaskStatus status) const;
    size_t running_count(const std::string& role) const;

    // Pid of the running task flagged primary, if any
    std::optional<pid_t> primary_pid() const;

private:
    struct Task {
        TaskSnapshot info;
        std::unique_ptr<WorkerHandle> handle;
        std::optional<TaskStatus> termination_reason;
    };

    void finish_locked(Task& task, TaskStatus status, ExitInfo exit_info);

    std::shared_ptr<TaskJournal> journal_;
    std::unordered_map<std::string, Task> tasks_;
    mutable std::mutex mutex_;
};

} // namespace warden::runtime
