#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace warden::core::paths {

// Best-effort path to current executable; empty if unavailable.
std::filesystem::path executable_path();

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Roots searched for .env (cwd and executable dir, plus two parents each).
std::vector<std::filesystem::path> project_search_paths();

// Directory for task journals, worker output and the action log.
// WARDEN_STATE_DIR, else /tmp/warden.
std::filesystem::path state_dir();

// Short host name, "unknown" if gethostname fails.
std::string host_name();

} // namespace warden::core::paths
