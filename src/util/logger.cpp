#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>

namespace asap::util {

void init_logger(spdlog::level::level_enum level) {
    auto console = spdlog::get("asap");
    if (!console) {
        console = spdlog::stdout_color_mt("asap");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum log_level_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")    return spdlog::level::trace;
    if (lower == "debug")    return spdlog::level::debug;
    if (lower == "info")     return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error")    return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace asap::util
