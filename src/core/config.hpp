#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace memsync::core::config {

// Load environment variables from the first .env found (idempotent).
// Searches the working directory and its parent when no paths are given.
void load_dotenv(const std::vector<std::filesystem::path>& search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Integer variable; fallback when missing or not a number.
int64_t get_env_int(const std::string& key, int64_t fallback);

} // namespace memsync::core::config
