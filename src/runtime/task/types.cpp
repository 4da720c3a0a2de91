#include "runtime/task/types.hpp"
#include <random>
#include <sstream>
#include <iomanip>

namespace warden::runtime {

namespace {

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_millis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

const char* task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::QUEUED:    return "queued";
        case TaskStatus::RUNNING:   return "running";
        case TaskStatus::COMPLETED: return "completed";
        case TaskStatus::FAILED:    return "failed";
        case TaskStatus::TIMED_OUT: return "timed_out";
        case TaskStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

TaskStatus task_status_from_string(const std::string& str) {
    if (str == "running")   return TaskStatus::RUNNING;
    if (str == "completed") return TaskStatus::COMPLETED;
    if (str == "failed")    return TaskStatus::FAILED;
    if (str == "timed_out") return TaskStatus::TIMED_OUT;
    if (str == "cancelled") return TaskStatus::CANCELLED;
    return TaskStatus::QUEUED;
}

nlohmann::json ExitInfo::to_json() const {
    return nlohmann::json{
        {"exit_code", exit_code},
        {"signal", signal},
        {"error", error},
        {"finished_at", to_millis(finished_at)}
    };
}

ExitInfo ExitInfo::from_json(const nlohmann::json& j) {
    ExitInfo info;
    info.exit_code = j.value("exit_code", -1);
    info.signal = j.value("signal", 0);
    info.error = j.value("error", "");
    info.finished_at = from_millis(j.value("finished_at", int64_t{0}));
    return info;
}

nlohmann::json TaskSnapshot::to_json() const {
    nlohmann::json j{
        {"task_id", id},
        {"status", task_status_to_string(status)},
        {"role", role},
        {"prompt", prompt},
        {"working_directory", working_directory},
        {"primary", primary},
        {"pid", pid},
        {"created_at", to_millis(created_at)},
        {"started_at", started_at ? nlohmann::json(to_millis(*started_at)) : nlohmann::json(nullptr)},
        {"exit", exit_info ? exit_info->to_json() : nlohmann::json(nullptr)}
    };
    return j;
}

TaskSnapshot TaskSnapshot::from_json(const nlohmann::json& j) {
    TaskSnapshot snap;
    snap.id = j.at("task_id").get<std::string>();
    snap.status = task_status_from_string(j.value("status", "queued"));
    snap.role = j.value("role", "");
    snap.prompt = j.value("prompt", "");
    snap.working_directory = j.value("working_directory", "");
    snap.primary = j.value("primary", false);
    snap.pid = j.value("pid", 0);
    snap.created_at = from_millis(j.value("created_at", int64_t{0}));
    if (j.contains("started_at") && !j["started_at"].is_null()) {
        snap.started_at = from_millis(j["started_at"].get<int64_t>());
    }
    if (j.contains("exit") && !j["exit"].is_null()) {
        snap.exit_info = ExitInfo::from_json(j["exit"]);
    }
    return snap;
}

std::string generate_task_id() {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist;
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
    return oss.str();
}

} // namespace warden::runtime
