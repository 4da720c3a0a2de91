#include "core/paths.hpp"
#include <cstdlib>
#include <unistd.h>
#include <limits.h>

namespace warden::core::paths {

std::filesystem::path executable_path() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}

std::filesystem::path executable_dir() {
    auto exe = executable_path();
    if (exe.empty()) {
        return {};
    }
    return exe.parent_path();
}

std::vector<std::filesystem::path> project_search_paths() {
    std::vector<std::filesystem::path> roots;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        roots.push_back(cwd);
        roots.push_back(cwd.parent_path());
        roots.push_back(cwd.parent_path().parent_path());
    }

    auto exe_dir = executable_dir();
    if (!exe_dir.empty()) {
        roots.push_back(exe_dir);
        roots.push_back(exe_dir.parent_path());
        roots.push_back(exe_dir.parent_path().parent_path());
    }

    // De-duplicate while preserving order.
    std::vector<std::filesystem::path> unique;
    for (const auto& p : roots) {
        if (p.empty()) continue;
        bool seen = false;
        for (const auto& u : unique) {
            if (u == p) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            unique.push_back(p);
        }
    }
    return unique;
}

std::filesystem::path state_dir() {
    const char* configured = std::getenv("WARDEN_STATE_DIR");
    if (configured && *configured) {
        return std::filesystem::path(configured);
    }
    return std::filesystem::path("/tmp/warden");
}

std::string host_name() {
    char buf[HOST_NAME_MAX + 1];
    if (gethostname(buf, sizeof(buf)) != 0) {
        return "unknown";
    }
    buf[HOST_NAME_MAX] = '\0';
    return std::string(buf);
}

} // namespace warden::core::paths
