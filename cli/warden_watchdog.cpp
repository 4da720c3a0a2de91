/*
 * warden-watchdog - periodic resource enforcement sweep
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "probe/resource_probe.hpp"
#include "services/health_check.hpp"
#include "services/service_control.hpp"
#include "watchdog/action_log.hpp"
#include "watchdog/signaller.hpp"
#include "watchdog/watchdog.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>

using namespace warden;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--once] [--json]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --once      Run a single sweep and exit (for cron)\n";
    std::cout << "  --json      Print the sweep report as JSON (with --once)\n";
    std::cout << "  -h, --help  Show this help message\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  WARDEN_MAX_WORKERS, WARDEN_WORKER_PATTERN, WARDEN_SESSION_DIR,\n";
    std::cout << "  WARDEN_BUILD_PATTERN, WARDEN_HEALTH_URL, WARDEN_SERVICE_RESTART_CMD,\n";
    std::cout << "  WARDEN_CRITICAL_FREE_GB, WARDEN_ORPHAN_PATTERNS, WARDEN_FLAG_PATH,\n";
    std::cout << "  WARDEN_ACTION_LOG, WARDEN_SWEEP_PERIOD_SEC, WARDEN_LOG_LEVEL\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    core::config::load_dotenv();
    core::init_logger();

    bool once = false;
    bool json_output = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--once") {
            once = true;
        } else if (arg == "--json") {
            json_output = true;
        } else {
            std::cerr << "Error: unknown option " << arg << "\n";
            return 1;
        }
    }

    try {
        auto config = watchdog::WatchdogConfig::from_env();

        probe::ProcProbe probe;
        watchdog::KillSignaller signaller;
        watchdog::ActionLog action_log(config.action_log);

        std::unique_ptr<services::HttpHealthProbe> health;
        std::unique_ptr<services::CommandServiceControl> service;
        if (!config.health_url.empty()) {
            health = std::make_unique<services::HttpHealthProbe>(config.health_url, config.health_timeout);
            service = std::make_unique<services::CommandServiceControl>(
                config.service_active_command, config.service_restart_command);
        }

        watchdog::Watchdog dog(config, probe, signaller, action_log, health.get(), service.get());

        if (once) {
            auto report = dog.sweep();
            if (json_output) {
                std::cout << report.to_json().dump(2, ' ', false,
                                                   nlohmann::json::error_handler_t::replace) << "\n";
            }
            return report.failures.empty() ? 0 : 1;
        }

        // Signals are taken synchronously by one thread
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);

        std::thread signal_thread([&dog, signals]() {
            int sig = 0;
            sigwait(&signals, &sig);
            spdlog::info("Received signal {}, stopping", sig);
            dog.stop();
        });

        dog.run();

        // run() only returns after stop(), which the signal thread issued
        signal_thread.join();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
