#include "runtime/worker/process.hpp"
#include "core/config.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace warden::runtime {

std::unique_ptr<ProcessWorker> ProcessWorker::start(
    const std::vector<std::string>& argv,
    const std::string& working_directory,
    const std::vector<std::pair<std::string, std::string>>& extra_env,
    const std::filesystem::path& output_path) {
    if (argv.empty()) {
        throw SpawnError("empty worker command");
    }

    // Everything the child needs is prepared before fork
    std::vector<char*> exec_args;
    for (const auto& arg : argv) {
        exec_args.push_back(const_cast<char*>(arg.c_str()));
    }
    exec_args.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        bool overridden = false;
        for (const auto& [key, _] : extra_env) {
            if (entry.compare(0, key.size() + 1, key + "=") == 0) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env_storage.push_back(std::move(entry));
    }
    for (const auto& [key, value] : extra_env) {
        env_storage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    int out_fd = -1;
    if (!output_path.empty()) {
        out_fd = open(output_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (out_fd < 0) {
            throw SpawnError("open " + output_path.string() + ": " + std::strerror(errno));
        }
    }

    // Reports exec failure back to the parent; closes on successful exec
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        if (out_fd >= 0) close(out_fd);
        throw SpawnError(std::string("pipe: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        if (out_fd >= 0) close(out_fd);
        throw SpawnError(std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process
        close(status_pipe[0]);
        if (out_fd >= 0) {
            dup2(out_fd, STDOUT_FILENO);
            dup2(out_fd, STDERR_FILENO);
        }
        int dev_null = open("/dev/null", O_RDONLY);
        if (dev_null >= 0) dup2(dev_null, STDIN_FILENO);

        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(126);
        }

        execvpe(exec_args[0], exec_args.data(), envp.data());

        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(status_pipe[1]);
    if (out_fd >= 0) close(out_fd);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    auto worker = std::make_unique<ProcessWorker>(SpawnedTag{}, pid);
    if (n > 0) {
        worker->wait();
        throw SpawnError("exec " + argv[0] + " in " + working_directory + ": " +
                         std::strerror(child_errno));
    }

    spdlog::debug("Started worker pid={} ({})", pid, argv[0]);
    return worker;
}

ProcessWorker::~ProcessWorker() {
    if (!reaped_) {
        // Best effort, never block in a destructor
        int status = 0;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reaped_ = true;
        } else {
            spdlog::debug("Worker pid={} still running at handle destruction", pid_);
        }
    }
}

void ProcessWorker::record_exit(int status) {
    ExitInfo info;
    info.finished_at = std::chrono::system_clock::now();
    if (WIFEXITED(status)) {
        info.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        info.signal = WTERMSIG(status);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    exit_ = info;
    reaped_ = true;
}

bool ProcessWorker::is_alive() {
    if (reaped_) {
        return false;
    }

    int status = 0;
    pid_t rc = waitpid(pid_, &status, WNOHANG);
    if (rc == 0) {
        return true;
    }
    if (rc == pid_) {
        record_exit(status);
        return false;
    }

    // ECHILD: someone else reaped it; exit status is lost
    ExitInfo info;
    info.error = "exit status unavailable";
    info.finished_at = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    exit_ = info;
    reaped_ = true;
    return false;
}

void ProcessWorker::send_signal(int sig) {
    // A reaped pid may already belong to another process
    if (reaped_) return;
    if (::kill(pid_, sig) != 0 && errno != ESRCH) {
        spdlog::warn("Failed to signal worker pid={} with {}: {}", pid_, sig, std::strerror(errno));
    }
}

void ProcessWorker::terminate() {
    send_signal(SIGTERM);
}

void ProcessWorker::kill() {
    send_signal(SIGKILL);
}

ExitInfo ProcessWorker::wait() {
    if (!reaped_) {
        int status = 0;
        pid_t rc;
        do {
            rc = waitpid(pid_, &status, 0);
        } while (rc < 0 && errno == EINTR);

        if (rc == pid_) {
            record_exit(status);
        } else {
            is_alive();
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_ ? *exit_ : ExitInfo{};
}

RunnerConfig RunnerConfig::from_env() {
    RunnerConfig config;
    auto command = core::config::get_env("WARDEN_WORKER_COMMAND");
    if (!command.empty()) {
        config.command = core::config::split_command(command);
    }
    config.default_working_directory =
        core::config::get_env_or("WARDEN_WORKER_CWD", config.default_working_directory);
    return config;
}

ProcessTaskRunner::ProcessTaskRunner(RunnerConfig config)
    : config_(std::move(config)) {
}

std::unique_ptr<WorkerHandle> ProcessTaskRunner::spawn(const WorkerSpec& spec) {
    std::vector<std::string> argv = config_.command;
    argv.push_back(spec.prompt);

    auto env = config_.env;
    env.emplace_back("WARDEN_TASK_ID", spec.task_id);

    std::string cwd = spec.working_directory.empty()
        ? config_.default_working_directory
        : spec.working_directory;

    spdlog::info("Spawning worker for task {} in {}", spec.task_id, cwd);
    return ProcessWorker::start(argv, cwd, env, spec.output_path);
}

} // namespace warden::runtime
