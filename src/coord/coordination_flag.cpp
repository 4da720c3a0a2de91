#include "coord/coordination_flag.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace warden::coord {

CoordinationFlag::CoordinationFlag(fs::path path, std::chrono::seconds staleness)
    : path_(std::move(path)), staleness_(staleness) {
}

const char* flag_state_to_string(FlagState state) {
    switch (state) {
        case FlagState::ABSENT: return "absent";
        case FlagState::ACTIVE: return "active";
        case FlagState::STALE: return "stale";
    }
    return "unknown";
}

std::optional<std::chrono::seconds> CoordinationFlag::age() const {
    struct stat st;
    if (stat(path_.c_str(), &st) != 0) {
        return std::nullopt;
    }
    auto modified = std::chrono::system_clock::from_time_t(st.st_mtime);
    auto elapsed = std::chrono::system_clock::now() - modified;
    if (elapsed < std::chrono::seconds(0)) {
        return std::chrono::seconds(0);
    }
    return std::chrono::duration_cast<std::chrono::seconds>(elapsed);
}

FlagState CoordinationFlag::state() const {
    auto current_age = age();
    if (!current_age) {
        return FlagState::ABSENT;
    }
    return *current_age >= staleness_ ? FlagState::STALE : FlagState::ACTIVE;
}

bool CoordinationFlag::is_active(bool* removed_stale) {
    if (removed_stale) {
        *removed_stale = false;
    }
    auto current_age = age();
    if (!current_age) {
        return false;
    }

    if (*current_age >= staleness_) {
        spdlog::warn("Coordination flag {} is stale ({}s old), removing",
            path_.string(), current_age->count());
        clear();
        if (removed_stale) {
            *removed_stale = true;
        }
        return false;
    }
    return true;
}

void CoordinationFlag::activate() {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
    }

    int fd = open(path_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "activate " + path_.string());
    }
    // Touch: refresh mtime even when the marker already existed
    int rc = futimens(fd, nullptr);
    int err = errno;
    close(fd);
    if (rc != 0) {
        throw std::system_error(err, std::generic_category(), "touch " + path_.string());
    }
    spdlog::debug("Coordination flag {} activated", path_.string());
}

void CoordinationFlag::clear() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::error("Failed to remove coordination flag {}: {}", path_.string(), ec.message());
    }
}

ProtectedMode::ProtectedMode(CoordinationFlag& flag)
    : flag_(flag) {
    flag_.activate();
    spdlog::info("Entered protected mode ({})", flag_.path().string());
}

ProtectedMode::~ProtectedMode() {
    flag_.clear();
    spdlog::info("Left protected mode ({})", flag_.path().string());
}

void ProtectedMode::refresh() {
    flag_.activate();
}

} // namespace warden::coord
