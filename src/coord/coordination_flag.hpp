#pragma once
#include <chrono>
#include <filesystem>
#include <optional>

namespace warden::coord {

constexpr std::chrono::seconds kDefaultStaleness{30 * 60};

enum class FlagState {
    ABSENT,
    ACTIVE,
    STALE
};

const char* flag_state_to_string(FlagState state);

// File marker a protected job sets to ask the watchdog for relaxed
// enforcement. The protected job is the only writer (activate/clear);
// the watchdog is the only reader and the only one that clears a stale marker.
class CoordinationFlag {
public:
    explicit CoordinationFlag(std::filesystem::path path,
                              std::chrono::seconds staleness = kDefaultStaleness);

    // True iff the marker exists and is younger than the staleness window.
    // A stale marker is removed and false is returned; removed_stale is set
    // when this call did the removal.
    bool is_active(bool* removed_stale = nullptr);

    // Read-only view of the marker, stale markers are left in place.
    FlagState state() const;

    // Create the marker or refresh its timestamp.
    void activate();

    // Remove the marker; missing is fine.
    void clear();

    // Age of the marker, nullopt if absent.
    std::optional<std::chrono::seconds> age() const;

    const std::filesystem::path& path() const { return path_; }
    std::chrono::seconds staleness() const { return staleness_; }

private:
    std::filesystem::path path_;
    std::chrono::seconds staleness_;
};

// Holds protected mode for the lifetime of the object.
class ProtectedMode {
public:
    explicit ProtectedMode(CoordinationFlag& flag);
    ~ProtectedMode();

    ProtectedMode(const ProtectedMode&) = delete;
    ProtectedMode& operator=(const ProtectedMode&) = delete;

    // Long jobs call this periodically to stay inside the staleness window.
    void refresh();

private:
    CoordinationFlag& flag_;
};

} // namespace warden::coord
