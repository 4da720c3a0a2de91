#include "services/service_control.hpp"
#include "runtime/worker/process.hpp"
#include <spdlog/spdlog.h>

namespace warden::services {

namespace {

bool run_command(const std::vector<std::string>& argv) {
    try {
        auto process = runtime::ProcessWorker::start(argv, "", {}, {});
        return process->wait().success();
    } catch (const runtime::SpawnError& e) {
        spdlog::warn("Cannot run {}: {}", argv.front(), e.what());
        return false;
    }
}

} // anonymous namespace

CommandServiceControl::CommandServiceControl(std::vector<std::string> active_command,
                                             std::vector<std::string> restart_command)
    : active_command_(std::move(active_command)),
      restart_command_(std::move(restart_command)) {
}

bool CommandServiceControl::is_active() {
    if (active_command_.empty()) {
        return true;
    }
    return run_command(active_command_);
}

bool CommandServiceControl::restart() {
    if (restart_command_.empty()) {
        spdlog::warn("No restart command configured");
        return false;
    }
    return run_command(restart_command_);
}

} // namespace warden::services
