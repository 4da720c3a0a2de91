#include "watchdog/signaller.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>

namespace warden::watchdog {

bool KillSignaller::send(pid_t pid, int signal) {
    // Never broadcast to a process group
    if (pid <= 1) {
        return false;
    }
    if (::kill(pid, signal) == 0) {
        return true;
    }
    if (errno != ESRCH) {
        spdlog::warn("kill({}, {}) failed: {}", pid, signal, std::strerror(errno));
    }
    return false;
}

} // namespace warden::watchdog
