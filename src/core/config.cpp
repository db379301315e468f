#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace memsync::core::config {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

} // namespace

void load_dotenv(const std::vector<std::filesystem::path>& search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> paths = search_paths;
    if (paths.empty()) {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        if (!ec) {
            paths.push_back(cwd);
            paths.push_back(cwd.parent_path());
        }
    }

    for (const auto& base : paths) {
        auto env_path = base / ".env";
        if (!std::filesystem::exists(env_path)) {
            continue;
        }

        std::ifstream file(env_path);
        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);

            // Skip comments
            if (line.empty() || line[0] == '#') continue;

            size_t eq_pos = line.find('=');
            if (eq_pos == std::string::npos) continue;

            std::string key = trim(line.substr(0, eq_pos));
            std::string value = unquote(trim(line.substr(eq_pos + 1)));

            if (!key.empty() && std::getenv(key.c_str()) == nullptr) {
                setenv(key.c_str(), value.c_str(), 0);
            }
        }
        spdlog::debug("Loaded environment from {}", env_path.string());
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

int64_t get_env_int(const std::string& key, int64_t fallback) {
    auto value = get_env(key);
    if (value.empty()) {
        return fallback;
    }

    try {
        size_t consumed = 0;
        int64_t parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            spdlog::warn("Ignoring non-numeric {}={}", key, value);
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring non-numeric {}={}", key, value);
        return fallback;
    }
}

} // namespace memsync::core::config
