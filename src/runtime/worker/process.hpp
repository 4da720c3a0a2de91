#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>
#include "runtime/task/types.hpp"

namespace warden::runtime {

// What to run for one task
struct WorkerSpec {
    std::string task_id;
    std::string prompt;
    std::string working_directory;
    std::filesystem::path output_path;      // stdout+stderr; empty inherits ours
};

// The worker could not be started (fork/exec/chdir failure)
class SpawnError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Handle to a running worker. The supervisor needs nothing beyond this.
class WorkerHandle {
public:
    virtual ~WorkerHandle() = default;

    virtual pid_t pid() const = 0;
    virtual bool is_alive() = 0;
    virtual void terminate() = 0;           // Graceful (SIGTERM)
    virtual void kill() = 0;                // Immediate (SIGKILL)
    virtual ExitInfo wait() = 0;            // Blocks until exit
};

// Spawns workers; throws SpawnError
class TaskRunner {
public:
    virtual ~TaskRunner() = default;
    virtual std::unique_ptr<WorkerHandle> spawn(const WorkerSpec& spec) = 0;
};

// A child process started with fork/exec
class ProcessWorker : public WorkerHandle {
    // Only start() can name this, so only start() can construct
    struct SpawnedTag {
        explicit SpawnedTag() = default;
    };

public:
    static std::unique_ptr<ProcessWorker> start(
        const std::vector<std::string>& argv,
        const std::string& working_directory,
        const std::vector<std::pair<std::string, std::string>>& extra_env,
        const std::filesystem::path& output_path);

    ProcessWorker(SpawnedTag, pid_t pid) : pid_(pid) {}
    ~ProcessWorker() override;

    ProcessWorker(const ProcessWorker&) = delete;
    ProcessWorker& operator=(const ProcessWorker&) = delete;

    pid_t pid() const override { return pid_; }
    bool is_alive() override;
    void terminate() override;
    void kill() override;
    ExitInfo wait() override;

private:
    void record_exit(int status);
    void send_signal(int sig);

    const pid_t pid_;
    std::atomic<bool> reaped_{false};
    std::optional<ExitInfo> exit_;
    std::mutex mutex_;
};

struct RunnerConfig {
    // The prompt is appended as the last argument
    std::vector<std::string> command = {"claude", "--print", "--dangerously-skip-permissions", "-p"};
    std::vector<std::pair<std::string, std::string>> env = {
        {"CLAUDECODE", "1"},
        {"CLAUDE_CODE_ENTRYPOINT", "spawned-agent"}
    };
    std::string default_working_directory = ".";

    // WARDEN_WORKER_COMMAND, WARDEN_WORKER_CWD
    static RunnerConfig from_env();
};

class ProcessTaskRunner : public TaskRunner {
public:
    explicit ProcessTaskRunner(RunnerConfig config = {});

    std::unique_ptr<WorkerHandle> spawn(const WorkerSpec& spec) override;

    const RunnerConfig& config() const { return config_; }

private:
    RunnerConfig config_;
};

} // namespace warden::runtime
