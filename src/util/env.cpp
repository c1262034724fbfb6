#include "util/env.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>
#include <unistd.h>

namespace asap::util {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void apply_dotenv_file(const std::filesystem::path& env_path) {
    std::ifstream file(env_path);
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Tolerate "export KEY=VALUE"
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (value.size() >= 2) {
            if ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\'')) {
                value = value.substr(1, value.size() - 2);
            }
        }

        if (!key.empty() && std::getenv(key.c_str()) == nullptr) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }
    spdlog::debug("Loaded environment from {}", env_path.string());
}

} // namespace

void load_dotenv() {
    static std::once_flag once;
    std::call_once(once, [] {
        std::vector<std::filesystem::path> search_paths = {
            std::filesystem::current_path() / ".env",
            "../.env",
        };

        char exe_path[PATH_MAX];
        ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
        if (len != -1) {
            exe_path[len] = '\0';
            auto exe_dir = std::filesystem::path(exe_path).parent_path();
            search_paths.push_back(exe_dir / ".env");
            search_paths.push_back(exe_dir.parent_path() / ".env");
        }

        std::error_code ec;
        for (const auto& env_path : search_paths) {
            if (std::filesystem::exists(env_path, ec)) {
                apply_dotenv_file(env_path);
                break;
            }
        }
    });
}

std::string env_string(const std::string& key, const std::string& fallback) {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr) {
        return fallback;
    }
    return std::string(value);
}

int env_int(const std::string& key, int fallback) {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring {}={}: not an integer", key, value);
        return fallback;
    }
}

double env_double(const std::string& key, double fallback) {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    try {
        size_t pos = 0;
        double parsed = std::stod(value, &pos);
        if (pos != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring {}={}: not a number", key, value);
        return fallback;
    }
}

bool env_bool(const std::string& key, bool fallback) {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;

    spdlog::warn("Ignoring {}={}: not a boolean", key, value);
    return fallback;
}

} // namespace asap::util
