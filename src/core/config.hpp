#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace warden::core::config {

// Load environment variables from a .env file (idempotent).
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Numeric variants; a missing or malformed value yields the fallback.
long get_env_int(const std::string& key, long fallback);
double get_env_double(const std::string& key, double fallback);

// Split a whitespace-separated command line ("systemctl restart foo") into argv.
std::vector<std::string> split_command(const std::string& command);

} // namespace warden::core::config
