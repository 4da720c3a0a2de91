#pragma once
#include <sys/types.h>

namespace warden::watchdog {

// Delivers signals to host processes
class ProcessSignaller {
public:
    virtual ~ProcessSignaller() = default;

    // False if the process is gone or not ours to signal
    virtual bool send(pid_t pid, int signal) = 0;
};

// kill(2)
class KillSignaller : public ProcessSignaller {
public:
    bool send(pid_t pid, int signal) override;
};

} // namespace warden::watchdog
