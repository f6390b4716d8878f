#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string>

namespace framecast::utils {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL,
    OFF
};

// Install the "framecast" console logger as the spdlog default.
// Safe to call more than once; later calls only change level and pattern.
void init_logging(LogLevel level = LogLevel::INFO, const std::string& pattern = "");

const char* log_level_name(LogLevel level);

// Case-insensitive; accepts the spdlog aliases (warning, err, fatal, none)
std::optional<LogLevel> parse_log_level(const std::string& name);

}  // namespace framecast::utils
