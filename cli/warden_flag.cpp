/*
 * warden-flag - hold or inspect protected mode for long-running batch jobs
 */

#include "coord/coordination_flag.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "runtime/worker/process.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace warden;

namespace {

std::atomic<int> g_forward_signal{0};

void on_signal(int sig) {
    g_forward_signal = sig;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--path <file>] activate|clear|status [--json]\n";
    std::cout << "       " << prog << " [--path <file>] run -- <command...>\n\n";
    std::cout << "Commands:\n";
    std::cout << "  activate   Create or refresh the protected-mode marker\n";
    std::cout << "  clear      Remove the marker\n";
    std::cout << "  status     Exit 0 if protected mode is active, 1 otherwise\n";
    std::cout << "  run        Hold protected mode while the command runs\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  WARDEN_FLAG_PATH       Marker path (default /tmp/night-watch-active)\n";
    std::cout << "  WARDEN_FLAG_STALE_SEC  Staleness window (default 1800)\n";
}

int run_protected(coord::CoordinationFlag& flag, const std::vector<std::string>& command) {
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    coord::ProtectedMode guard(flag);

    std::unique_ptr<runtime::ProcessWorker> child;
    try {
        child = runtime::ProcessWorker::start(command, "", {}, {});
    } catch (const runtime::SpawnError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 127;
    }

    // Refresh well inside the staleness window
    auto refresh_every = std::max(std::chrono::seconds(1), flag.staleness() / 3);
    auto next_refresh = std::chrono::steady_clock::now() + refresh_every;

    while (child->is_alive()) {
        if (int sig = g_forward_signal.exchange(0); sig != 0) {
            spdlog::info("Forwarding signal {} to pid {}", sig, child->pid());
            child->terminate();
        }
        if (std::chrono::steady_clock::now() >= next_refresh) {
            guard.refresh();
            next_refresh += refresh_every;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    auto exit_info = child->wait();
    if (exit_info.signal != 0) {
        return 128 + exit_info.signal;
    }
    return exit_info.exit_code;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    core::config::load_dotenv();
    core::init_logger();

    std::string path = core::config::get_env_or("WARDEN_FLAG_PATH", "/tmp/night-watch-active");
    auto staleness = std::chrono::seconds(core::config::get_env_int(
        "WARDEN_FLAG_STALE_SEC", coord::kDefaultStaleness.count()));
    bool json_output = false;
    std::string verb;
    std::vector<std::string> command;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--path") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --path requires a file\n";
                return 2;
            }
            path = argv[++i];
        } else if (arg == "--json") {
            json_output = true;
        } else if (arg == "--") {
            command.assign(argv + i + 1, argv + argc);
            break;
        } else if (verb.empty()) {
            verb = arg;
        } else {
            std::cerr << "Error: unexpected argument " << arg << "\n";
            return 2;
        }
    }

    coord::CoordinationFlag flag(path, staleness);

    try {
        if (verb == "activate") {
            flag.activate();
            return 0;
        }
        if (verb == "clear") {
            flag.clear();
            return 0;
        }
        if (verb == "status") {
            // Read-only: a stale marker is reported but left for the watchdog
            auto age = flag.age();
            auto state = flag.state();
            bool active = state == coord::FlagState::ACTIVE;
            if (json_output) {
                nlohmann::json j{
                    {"path", flag.path().string()},
                    {"active", active},
                    {"state", coord::flag_state_to_string(state)},
                    {"age_seconds", age ? nlohmann::json(age->count()) : nlohmann::json(nullptr)},
                    {"staleness_seconds", flag.staleness().count()}
                };
                std::cout << j.dump(2) << "\n";
            } else {
                std::cout << (active ? "active" : "inactive")
                          << (state == coord::FlagState::STALE ? " (stale)" : "") << "\n";
            }
            return active ? 0 : 1;
        }
        if (verb == "run") {
            if (command.empty()) {
                std::cerr << "Error: run needs a command after --\n";
                return 2;
            }
            return run_protected(flag, command);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    print_usage(argv[0]);
    return 2;
}
