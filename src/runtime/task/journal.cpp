#include "runtime/task/journal.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace warden::runtime {

TaskJournal::TaskJournal(fs::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        spdlog::warn("Cannot create task journal {}: {}", directory_.string(), ec.message());
    }
}

fs::path TaskJournal::output_path(const std::string& id) const {
    return directory_ / (id + ".log");
}

bool TaskJournal::save(const TaskSnapshot& task) {
    auto target = directory_ / (task.id + ".json");
    auto tmp = directory_ / (task.id + ".json.tmp");

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            spdlog::error("Cannot write task journal entry {}", tmp.string());
            return false;
        }
        try {
            // Prompts are caller text; invalid UTF-8 is replaced, not fatal
            out << task.to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        } catch (const nlohmann::json::exception& e) {
            spdlog::error("Cannot serialize task {} for the journal: {}", task.id, e.what());
            out.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            return false;
        }
        if (!out) {
            spdlog::error("Short write on task journal entry {}", tmp.string());
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        spdlog::error("Cannot publish task journal entry {}: {}", target.string(), ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

std::optional<TaskSnapshot> TaskJournal::load(const std::string& id) const {
    // Ids are opaque but must not escape the journal directory
    if (id.empty() || id.find('/') != std::string::npos || id == "." || id == "..") {
        return std::nullopt;
    }

    std::ifstream in(directory_ / (id + ".json"));
    if (!in) {
        return std::nullopt;
    }

    try {
        auto j = nlohmann::json::parse(in);
        return TaskSnapshot::from_json(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Corrupt task journal entry for {}: {}", id, e.what());
        return std::nullopt;
    }
}

} // namespace warden::runtime
