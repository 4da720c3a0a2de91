#pragma once
#include <string>
#include <vector>

namespace warden::services {

// Start/stop control over the sibling service the watchdog keeps alive
class ServiceControl {
public:
    virtual ~ServiceControl() = default;

    // Liveness is only probed for a service that is supposed to be running
    virtual bool is_active() = 0;
    virtual bool restart() = 0;
};

// Runs external commands, e.g. "systemctl is-active --quiet api.service".
// An empty active command means the service is always considered active.
class CommandServiceControl : public ServiceControl {
public:
    CommandServiceControl(std::vector<std::string> active_command,
                          std::vector<std::string> restart_command);

    bool is_active() override;
    bool restart() override;

private:
    std::vector<std::string> active_command_;
    std::vector<std::string> restart_command_;
};

} // namespace warden::services
