#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <nlohmann/json.hpp>

namespace warden::runtime {

// Task lifecycle: QUEUED -> RUNNING -> one terminal state
enum class TaskStatus {
    QUEUED,
    RUNNING,
    COMPLETED,
    FAILED,
    TIMED_OUT,
    CANCELLED
};

const char* task_status_to_string(TaskStatus status);
TaskStatus task_status_from_string(const std::string& str);

inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED ||
           status == TaskStatus::TIMED_OUT || status == TaskStatus::CANCELLED;
}

// How a worker ended
struct ExitInfo {
    int exit_code = -1;                     // -1 when killed by a signal or never started
    int signal = 0;                         // Terminating signal, 0 if exited normally
    std::string error;                      // Spawn failure or supervisor reason
    std::chrono::system_clock::time_point finished_at{};

    bool success() const { return exit_code == 0 && signal == 0 && error.empty(); }

    nlohmann::json to_json() const;
    static ExitInfo from_json(const nlohmann::json& j);
};

// Copyable view of a task, without its process handle
struct TaskSnapshot {
    std::string id;
    TaskStatus status = TaskStatus::QUEUED;
    std::string role;
    std::string prompt;
    std::string working_directory;
    bool primary = false;
    pid_t pid = 0;
    std::chrono::system_clock::time_point created_at{};
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<ExitInfo> exit_info;

    nlohmann::json to_json() const;
    static TaskSnapshot from_json(const nlohmann::json& j);
};

// Random 8 hex digit id
std::string generate_task_id();

} // namespace warden::runtime
