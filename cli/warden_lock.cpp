/*
 * warden-lock - run a command while holding a repository's operation lock
 *
 * Exit codes:
 *   0    command succeeded
 *   1    usage error, not a repository, lock file unusable
 *   124  lock not acquired before the timeout
 *   125  the command itself exited 124
 *   127  the command could not be started
 *   *    the command's own exit code
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "lock/lock_broker.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace warden;

namespace {

constexpr int kUsageExitCode = 1;
constexpr int kSpawnFailedExitCode = 127;
constexpr int kRemappedTimeoutExitCode = 125;

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--timeout <sec>] <repo-path> <command...>\n";
    std::cout << "       " << prog << " --holder <repo-path>\n\n";
    std::cout << "Options:\n";
    std::cout << "  --timeout <sec>  Max wait for the lock (default 120, WARDEN_LOCK_TIMEOUT_SEC)\n";
    std::cout << "  --holder         Print the last holder recorded in the lock file\n";
    std::cout << "  -h, --help       Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << prog << " /srv/repo git push origin main\n";
    std::cout << "  " << prog << " --timeout 30 /srv/repo git pull --rebase\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    core::config::load_dotenv();
    core::init_logger();

    lock::LockConfig config = lock::LockConfig::from_env();
    bool show_holder = false;

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--timeout") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --timeout requires seconds\n";
                return kUsageExitCode;
            }
            try {
                double seconds = std::stod(argv[++i]);
                if (seconds < 0) throw std::out_of_range("negative");
                config.timeout = std::chrono::milliseconds(static_cast<long>(seconds * 1000));
            } catch (const std::logic_error&) {
                std::cerr << "Error: invalid timeout: " << argv[i] << "\n";
                return kUsageExitCode;
            }
        } else if (arg == "--holder") {
            show_holder = true;
        } else if (arg == "--") {
            ++i;
            break;
        } else {
            break;
        }
    }

    if (i >= argc) {
        print_usage(argv[0]);
        return kUsageExitCode;
    }
    std::string repo = argv[i++];
    lock::LockBroker broker(config);

    if (show_holder) {
        auto holder = broker.read_holder(repo);
        if (!holder) {
            std::cerr << "No lock metadata at " << broker.lock_path_for(repo).string() << "\n";
            return kUsageExitCode;
        }
        std::cout << *holder << "\n";
        return 0;
    }

    std::vector<std::string> command(argv + i, argv + argc);
    if (command.empty()) {
        print_usage(argv[0]);
        return kUsageExitCode;
    }

    auto result = broker.with_lock(repo, command);
    switch (result.status) {
        case lock::LockStatus::OK:
            // 124 always means contention
            if (result.exit_code == lock::kLockTimeoutExitCode) {
                return kRemappedTimeoutExitCode;
            }
            return result.exit_code;
        case lock::LockStatus::TIMEOUT:
            std::cerr << "Error: Could not acquire lock after "
                      << std::chrono::duration_cast<std::chrono::seconds>(config.timeout).count() << "s\n";
            std::cerr << "Another operation may be in progress.\n";
            if (auto holder = broker.read_holder(repo)) {
                std::cerr << "Last holder: " << *holder << "\n";
            }
            std::cerr << "Lock file: " << broker.lock_path_for(repo).string() << "\n";
            return lock::kLockTimeoutExitCode;
        case lock::LockStatus::INVALID_RESOURCE:
            std::cerr << "Error: " << repo << " is not a repository (" << result.error << ")\n";
            return kUsageExitCode;
        case lock::LockStatus::SPAWN_FAILED:
            std::cerr << "Error: " << result.error << "\n";
            return kSpawnFailedExitCode;
        case lock::LockStatus::IO_ERROR:
        default:
            std::cerr << "Error: " << result.error << "\n";
            return kUsageExitCode;
    }
}
