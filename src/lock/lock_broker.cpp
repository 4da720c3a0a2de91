#include "lock/lock_broker.hpp"
#include "core/config.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <fcntl.h>
#include <pthread.h>
#include <sys/file.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace warden::lock {

namespace {

// Interval at which the timer keeps re-firing once the deadline has passed.
// Closes the window where the first signal lands before flock() is entered.
constexpr auto kTimerRepeat = std::chrono::milliseconds(10);

int lock_timer_signal() {
    return SIGRTMIN + 3;
}

void on_lock_timer(int) {}

void install_timer_handler() {
    static std::once_flag once;
    std::call_once(once, []() {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = on_lock_timer;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;  // no SA_RESTART: a blocked flock() must return EINTR
        sigaction(lock_timer_signal(), &sa, nullptr);
    });
}

timespec to_timespec(std::chrono::nanoseconds ns) {
    timespec ts;
    ts.tv_sec = static_cast<time_t>(ns.count() / 1000000000LL);
    ts.tv_nsec = static_cast<long>(ns.count() % 1000000000LL);
    return ts;
}

// One-shot-then-repeating timer that signals only the creating thread.
class ThreadDeadline {
public:
    explicit ThreadDeadline(std::chrono::milliseconds after) {
        install_timer_handler();

        sigset_t unblock;
        sigemptyset(&unblock);
        sigaddset(&unblock, lock_timer_signal());
        pthread_sigmask(SIG_UNBLOCK, &unblock, &saved_mask_);

        struct sigevent sev;
        std::memset(&sev, 0, sizeof(sev));
        sev.sigev_notify = SIGEV_THREAD_ID;
        sev.sigev_signo = lock_timer_signal();
        sev._sigev_un._tid = static_cast<pid_t>(syscall(SYS_gettid));
        if (timer_create(CLOCK_MONOTONIC, &sev, &timer_) != 0) {
            int err = errno;
            pthread_sigmask(SIG_SETMASK, &saved_mask_, nullptr);
            throw std::system_error(err, std::generic_category(), "timer_create");
        }

        struct itimerspec spec;
        spec.it_value = to_timespec(after);
        spec.it_interval = to_timespec(kTimerRepeat);
        if (spec.it_value.tv_sec == 0 && spec.it_value.tv_nsec == 0) {
            spec.it_value.tv_nsec = 1;
        }
        if (timer_settime(timer_, 0, &spec, nullptr) != 0) {
            int err = errno;
            timer_delete(timer_);
            pthread_sigmask(SIG_SETMASK, &saved_mask_, nullptr);
            throw std::system_error(err, std::generic_category(), "timer_settime");
        }
    }

    ~ThreadDeadline() {
        timer_delete(timer_);
        pthread_sigmask(SIG_SETMASK, &saved_mask_, nullptr);
    }

    ThreadDeadline(const ThreadDeadline&) = delete;
    ThreadDeadline& operator=(const ThreadDeadline&) = delete;

private:
    timer_t timer_{};
    sigset_t saved_mask_;
};

// Owns the lock file descriptor; closing it releases the flock.
class LockFd {
public:
    explicit LockFd(int fd) : fd_(fd) {}
    ~LockFd() {
        if (fd_ >= 0) close(fd_);
    }
    LockFd(const LockFd&) = delete;
    LockFd& operator=(const LockFd&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

void write_metadata(int fd, const std::string& description) {
    std::ostringstream line;
    line << getpid() << ":" << core::paths::host_name() << ":" << iso8601_now()
         << ":" << description << "\n";
    std::string text = line.str();

    // Best effort: metadata never decides who holds the lock.
    if (ftruncate(fd, 0) != 0) {
        spdlog::debug("Could not truncate lock metadata: {}", std::strerror(errno));
        return;
    }
    if (pwrite(fd, text.data(), text.size(), 0) < 0) {
        spdlog::debug("Could not write lock metadata: {}", std::strerror(errno));
    }
}

std::string join(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) out += ' ';
        out += argv[i];
    }
    return out;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

} // namespace

const char* lock_status_to_string(LockStatus status) {
    switch (status) {
        case LockStatus::OK:               return "OK";
        case LockStatus::INVALID_RESOURCE: return "INVALID_RESOURCE";
        case LockStatus::TIMEOUT:          return "TIMEOUT";
        case LockStatus::SPAWN_FAILED:     return "SPAWN_FAILED";
        case LockStatus::IO_ERROR:         return "IO_ERROR";
        default: return "UNKNOWN";
    }
}

LockConfig LockConfig::from_env() {
    LockConfig config;
    config.control_dir = core::config::get_env_or("WARDEN_LOCK_CONTROL_DIR", config.control_dir);
    config.lock_name = core::config::get_env_or("WARDEN_LOCK_NAME", config.lock_name);
    config.timeout = std::chrono::seconds(core::config::get_env_int("WARDEN_LOCK_TIMEOUT_SEC", 120));
    return config;
}

std::string iso8601_now() {
    std::time_t now = std::time(nullptr);
    std::tm local;
    localtime_r(&now, &local);

    char buf[64];
    size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S%z", &local);
    std::string out(buf, len);
    // strftime gives +0000; ISO 8601 extended form wants +00:00
    if (out.size() >= 5) {
        out.insert(out.size() - 2, ":");
    }
    return out;
}

LockBroker::LockBroker(LockConfig config)
    : config_(std::move(config)) {
}

fs::path LockBroker::lock_path_for(const fs::path& resource) const {
    return resource / config_.control_dir / config_.lock_name;
}

LockResult LockBroker::with_lock(const fs::path& resource, const std::vector<std::string>& argv) {
    return with_lock(resource, argv, config_.timeout);
}

LockResult LockBroker::with_lock(const fs::path& resource,
                                 const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        LockResult result;
        result.status = LockStatus::SPAWN_FAILED;
        result.error = "empty command";
        return result;
    }

    // Build exec arguments before fork; the child only execs.
    std::vector<char*> exec_args;
    exec_args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        exec_args.push_back(const_cast<char*>(arg.c_str()));
    }
    exec_args.push_back(nullptr);

    std::string description = join(argv);
    bool spawn_failed = false;

    LockResult result = run_locked(resource, description, timeout, [&](int lock_fd) {
        pid_t pid = fork();
        if (pid < 0) {
            spdlog::error("fork failed for locked command: {}", std::strerror(errno));
            spawn_failed = true;
            return 1;
        }

        if (pid == 0) {
            // Hand the lock to the command: drop close-on-exec for this fd only.
            fcntl(lock_fd, F_SETFD, 0);
            sigset_t none;
            sigemptyset(&none);
            sigprocmask(SIG_SETMASK, &none, nullptr);
            execvp(exec_args[0], exec_args.data());
            _exit(127);
        }

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                spdlog::error("waitpid failed for locked command: {}", std::strerror(errno));
                return 1;
            }
        }
        return decode_wait_status(status);
    });

    if (spawn_failed && result.ok()) {
        result.status = LockStatus::SPAWN_FAILED;
        result.error = "could not start " + argv[0];
    }
    return result;
}

LockResult LockBroker::with_lock(const fs::path& resource,
                                 const std::string& description,
                                 const std::function<int()>& fn,
                                 std::chrono::milliseconds timeout) {
    return run_locked(resource, description, timeout, [&](int) { return fn(); });
}

LockResult LockBroker::run_locked(const fs::path& resource,
                                  const std::string& description,
                                  std::chrono::milliseconds timeout,
                                  const std::function<int(int lock_fd)>& body) {
    LockResult result;

    std::error_code ec;
    if (!fs::is_directory(resource / config_.control_dir, ec)) {
        result.status = LockStatus::INVALID_RESOURCE;
        result.error = resource.string() + " has no " + config_.control_dir + " directory";
        spdlog::error("Refusing to lock {}: {}", resource.string(), result.error);
        return result;
    }

    auto lock_path = lock_path_for(resource);
    // No O_TRUNC: the current holder's metadata must survive until we own the lock.
    int raw_fd = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666);
    if (raw_fd < 0) {
        result.status = LockStatus::IO_ERROR;
        result.error = "open " + lock_path.string() + ": " + std::strerror(errno);
        spdlog::error("{}", result.error);
        return result;
    }
    LockFd fd(raw_fd);

    auto start = std::chrono::steady_clock::now();
    bool acquired = (flock(fd.get(), LOCK_EX | LOCK_NB) == 0);

    if (!acquired && errno != EWOULDBLOCK) {
        result.status = LockStatus::IO_ERROR;
        result.error = std::string("flock: ") + std::strerror(errno);
        spdlog::error("Lock {} failed: {}", lock_path.string(), result.error);
        return result;
    }

    if (!acquired && timeout.count() > 0) {
        spdlog::info("Waiting up to {}ms for lock {}", timeout.count(), lock_path.string());
        auto deadline = start + timeout;
        try {
            ThreadDeadline timer(timeout);
            while (true) {
                if (flock(fd.get(), LOCK_EX) == 0) {
                    acquired = true;
                    break;
                }
                if (errno != EINTR) {
                    result.status = LockStatus::IO_ERROR;
                    result.error = std::string("flock: ") + std::strerror(errno);
                    spdlog::error("Lock {} failed: {}", lock_path.string(), result.error);
                    return result;
                }
                if (std::chrono::steady_clock::now() >= deadline) {
                    break;
                }
            }
        } catch (const std::system_error& e) {
            result.status = LockStatus::IO_ERROR;
            result.error = e.what();
            spdlog::error("Lock {} failed: {}", lock_path.string(), result.error);
            return result;
        }
    }

    result.waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!acquired) {
        result.status = LockStatus::TIMEOUT;
        result.error = "could not acquire " + lock_path.string() + " after " +
                       std::to_string(timeout.count()) + "ms";
        auto holder = read_holder(resource);
        spdlog::warn("Lock timeout on {} (holder: {})", lock_path.string(),
            holder ? *holder : std::string("unknown"));
        return result;
    }

    spdlog::debug("Acquired {} after {}ms", lock_path.string(), result.waited.count());
    write_metadata(fd.get(), description);

    result.status = LockStatus::OK;
    result.exit_code = body(fd.get());
    return result;
}

std::optional<std::string> LockBroker::read_holder(const fs::path& resource) const {
    std::ifstream file(lock_path_for(resource));
    if (!file) {
        return std::nullopt;
    }
    std::string line;
    if (!std::getline(file, line) || line.empty()) {
        return std::nullopt;
    }
    return line;
}

} // namespace warden::lock
