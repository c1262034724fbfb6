#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace asap::util {

// Install the colored "asap" console logger as the spdlog default
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "critical", "off"; anything else is info
spdlog::level::level_enum log_level_from_string(const std::string& name);

} // namespace asap::util
