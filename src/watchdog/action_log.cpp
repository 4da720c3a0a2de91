#include "watchdog/action_log.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <system_error>

namespace warden::watchdog {

ActionLog::ActionLog(const std::filesystem::path& path)
    : path_(path) {
    if (path_.empty()) {
        return;
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    // Not registered: several watchdogs (tests) may log to different files
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_.string(), false);
    file_logger_ = std::make_shared<spdlog::logger>("warden-actions", sink);
    file_logger_->set_pattern("[%Y-%m-%d %H:%M:%S] %v");
    file_logger_->set_level(spdlog::level::info);
    file_logger_->flush_on(spdlog::level::info);
}

void ActionLog::write(const std::string& entry) {
    if (file_logger_) {
        file_logger_->info(entry);
    }
    spdlog::info("[watchdog] {}", entry);
}

} // namespace warden::watchdog
