/**
 * Warden Lock Broker
 *
 * Cross-process, cross-container mutual exclusion for a shared repository.
 * The lock is a kernel advisory lock (flock) on a file inside the
 * repository's own control directory, so every process that sees the
 * repository through the same mount contends on the same lock. The kernel
 * drops the lock when the last descriptor closes, so a crashed holder can
 * never leave it held.
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace warden::lock {

// Exit code reserved for "could not acquire the lock in time".
constexpr int kLockTimeoutExitCode = 124;

enum class LockStatus {
    OK,                 // Lock acquired, command ran (see exit_code)
    INVALID_RESOURCE,   // Control directory missing: not the expected kind of resource
    TIMEOUT,            // Another holder kept the lock past the timeout
    SPAWN_FAILED,       // Lock acquired but the command could not be started
    IO_ERROR            // Lock file could not be opened or locked
};

const char* lock_status_to_string(LockStatus status);

struct LockConfig {
    std::string control_dir = ".git";
    std::string lock_name = ".git-operations.lock";
    std::chrono::milliseconds timeout{std::chrono::seconds(120)};

    // WARDEN_LOCK_TIMEOUT_SEC, WARDEN_LOCK_CONTROL_DIR, WARDEN_LOCK_NAME
    static LockConfig from_env();
};

struct LockResult {
    LockStatus status = LockStatus::OK;
    int exit_code = 0;                  // Command's own exit status, only meaningful when OK
    std::string error;
    std::chrono::milliseconds waited{0};

    bool ok() const { return status == LockStatus::OK; }
};

class LockBroker {
public:
    explicit LockBroker(LockConfig config = {});

    // <resource>/<control_dir>/<lock_name>
    std::filesystem::path lock_path_for(const std::filesystem::path& resource) const;

    // Run argv as a child process while holding the resource lock. The lock
    // descriptor is inherited by that child only, so the lock stays held until
    // both the command and this call are done.
    LockResult with_lock(const std::filesystem::path& resource,
                         const std::vector<std::string>& argv);
    LockResult with_lock(const std::filesystem::path& resource,
                         const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout);

    // Run fn in the calling thread while holding the resource lock.
    // description is recorded in the lock metadata.
    LockResult with_lock(const std::filesystem::path& resource,
                         const std::string& description,
                         const std::function<int()>& fn,
                         std::chrono::milliseconds timeout);

    // Last holder metadata ("pid:host:timestamp:command"), diagnostic only.
    std::optional<std::string> read_holder(const std::filesystem::path& resource) const;

    const LockConfig& config() const { return config_; }

private:
    LockConfig config_;

    LockResult run_locked(const std::filesystem::path& resource,
                          const std::string& description,
                          std::chrono::milliseconds timeout,
                          const std::function<int(int lock_fd)>& body);
};

// ISO 8601 local time with numeric offset, e.g. 2026-01-21T03:04:05+00:00
std::string iso8601_now();

} // namespace warden::lock
