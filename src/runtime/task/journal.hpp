#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "runtime/task/types.hpp"

namespace warden::runtime {

// One JSON file per finished task, so results outlive acknowledgment and
// supervisor restarts.
class TaskJournal {
public:
    explicit TaskJournal(std::filesystem::path directory);

    // Write <dir>/<id>.json atomically (temp file + rename).
    bool save(const TaskSnapshot& task);

    std::optional<TaskSnapshot> load(const std::string& id) const;

    std::filesystem::path output_path(const std::string& id) const;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
};

} // namespace warden::runtime
