#include "core/config.hpp"
#include "core/paths.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace warden::core::config {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// KEY=VALUE with optional surrounding quotes; comments and blanks are skipped.
bool parse_dotenv_line(const std::string& raw, std::string& key, std::string& value) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return false;

    size_t eq_pos = line.find('=');
    if (eq_pos == std::string::npos) return false;

    key = trim(line.substr(0, eq_pos));
    value = trim(line.substr(eq_pos + 1));

    if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
            value = value.substr(1, value.size() - 2);
        }
    }
    return !key.empty();
}

} // namespace

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> search_paths = paths::project_search_paths();
    for (const auto& p : extra_search_paths) {
        search_paths.push_back(p);
    }

    for (const auto& base : search_paths) {
        auto env_path = base / ".env";
        std::error_code ec;
        if (!std::filesystem::exists(env_path, ec)) {
            continue;
        }

        std::ifstream file(env_path);
        std::string line;
        std::string key;
        std::string value;
        int applied = 0;
        while (std::getline(file, line)) {
            if (!parse_dotenv_line(line, key, value)) continue;
            // Real environment wins over the file
            if (std::getenv(key.c_str()) == nullptr) {
                setenv(key.c_str(), value.c_str(), 0);
                applied++;
            }
        }
        spdlog::debug("Loaded {} settings from {}", applied, env_path.string());
        break;
    }
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

long get_env_int(const std::string& key, long fallback) {
    auto value = get_env(key);
    if (value.empty()) return fallback;
    try {
        size_t used = 0;
        long parsed = std::stol(value, &used);
        if (used != value.size()) {
            spdlog::warn("Ignoring malformed {}={}", key, value);
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring malformed {}={}", key, value);
        return fallback;
    }
}

double get_env_double(const std::string& key, double fallback) {
    auto value = get_env(key);
    if (value.empty()) return fallback;
    try {
        size_t used = 0;
        double parsed = std::stod(value, &used);
        if (used != value.size()) {
            spdlog::warn("Ignoring malformed {}={}", key, value);
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring malformed {}={}", key, value);
        return fallback;
    }
}

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> argv;
    std::istringstream iss(command);
    std::string word;
    while (iss >> word) {
        argv.push_back(word);
    }
    return argv;
}

} // namespace warden::core::config
