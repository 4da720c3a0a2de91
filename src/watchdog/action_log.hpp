#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace warden::watchdog {

// Append-only, timestamped record of every enforcement action.
// Entries are flushed as they are written and mirrored to the console log.
class ActionLog {
public:
    // Empty path: console only
    explicit ActionLog(const std::filesystem::path& path);

    template<typename... Args>
    void record(fmt::format_string<Args...> format, Args&&... args) {
        write(fmt::format(format, std::forward<Args>(args)...));
    }

    void write(const std::string& entry);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::shared_ptr<spdlog::logger> file_logger_;
};

} // namespace warden::watchdog
