/*
 * warden-agent - submit background work through admission control
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "probe/resource_probe.hpp"
#include "runtime/worker/process.hpp"
#include "services/notifier.hpp"
#include "supervisor/supervisor.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <sstream>
#include <string>
#include <thread>

using namespace warden;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--cwd <dir>] [--primary] [--id <task-id>] <prompt...>\n";
    std::cout << "       " << prog << " --status <task-id>\n";
    std::cout << "       " << prog << " --queue\n\n";
    std::cout << "Options:\n";
    std::cout << "  --cwd <dir>      Working directory for the worker\n";
    std::cout << "  --primary        Mark the worker as primary (never culled)\n";
    std::cout << "  --id <task-id>   Use this task id instead of a generated one\n";
    std::cout << "  --status <id>    Print a task from the journal\n";
    std::cout << "  --queue          Print queue and admission status\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  WARDEN_WORKER_COMMAND, WARDEN_MAX_CONCURRENT, WARDEN_MIN_FREE_GB,\n";
    std::cout << "  WARDEN_TASK_TIMEOUT_SEC, WARDEN_TASK_DIR, WARDEN_NOTIFY_CMD\n";
}

std::shared_ptr<services::Notifier> make_notifier() {
    std::shared_ptr<services::Notifier> sink;
    auto command = core::config::split_command(core::config::get_env("WARDEN_NOTIFY_CMD"));
    if (command.empty()) {
        sink = std::make_shared<services::LogNotifier>();
    } else {
        sink = std::make_shared<services::CommandNotifier>(command);
    }
    return std::make_shared<services::AsyncNotifier>(sink);
}

// Prompts are caller text and may not be valid UTF-8
void print_json(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    core::config::load_dotenv();
    core::init_logger();

    std::string cwd;
    std::string task_id;
    std::string status_id;
    bool primary = false;
    bool show_queue = false;
    std::ostringstream prompt_stream;
    bool first = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if ((arg == "--cwd" || arg == "--id" || arg == "--status") && i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value\n";
            return 1;
        }
        if (arg == "--cwd") {
            cwd = argv[++i];
        } else if (arg == "--id") {
            task_id = argv[++i];
        } else if (arg == "--status") {
            status_id = argv[++i];
        } else if (arg == "--primary") {
            primary = true;
        } else if (arg == "--queue") {
            show_queue = true;
        } else {
            if (!first) prompt_stream << " ";
            prompt_stream << arg;
            first = false;
        }
    }

    try {
        auto config = supervisor::SupervisorConfig::from_env();
        probe::ProcProbe probe;
        auto runner = std::make_shared<runtime::ProcessTaskRunner>(runtime::RunnerConfig::from_env());

        if (!status_id.empty() || show_queue) {
            supervisor::Supervisor sup(config, probe, runner);
            if (show_queue) {
                print_json(sup.queue_status());
                return 0;
            }
            auto task = sup.status(status_id);
            if (!task) {
                std::cerr << "Error: unknown task " << status_id << "\n";
                return 1;
            }
            print_json(task->to_json());
            return 0;
        }

        std::string prompt = prompt_stream.str();
        if (prompt.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        auto notifier = make_notifier();

        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        sigaddset(&signals, SIGUSR1);           // Wakes the signal thread on exit
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);

        supervisor::Supervisor sup(config, probe, runner, notifier);
        sup.start();
        std::string id = sup.submit(prompt, cwd, primary, task_id);
        std::cout << id << std::endl;

        std::thread signal_thread([&sup, &id, signals]() {
            int sig = 0;
            sigwait(&signals, &sig);
            if (sig == SIGUSR1) {
                return;
            }
            spdlog::info("Received signal {}, cancelling task {}", sig, id);
            sup.cancel(id);
        });

        auto task = sup.wait(id, std::chrono::hours(24 * 365));
        sup.shutdown();

        pthread_kill(signal_thread.native_handle(), SIGUSR1);
        signal_thread.join();

        if (!task) {
            std::cerr << "Error: task " << id << " disappeared\n";
            return 1;
        }
        print_json(task->to_json());
        return task->status == runtime::TaskStatus::COMPLETED ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
