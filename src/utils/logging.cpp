#include "framecast/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace framecast::utils {

namespace {

constexpr const char* kLoggerName = "framecast";
constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] %^%l%$: %v";

constexpr std::pair<const char*, LogLevel> kLevelNames[] = {
    {"trace", LogLevel::TRACE},       {"debug", LogLevel::DEBUG},
    {"info", LogLevel::INFO},         {"warn", LogLevel::WARN},
    {"warning", LogLevel::WARN},      {"error", LogLevel::ERROR},
    {"err", LogLevel::ERROR},         {"critical", LogLevel::CRITICAL},
    {"fatal", LogLevel::CRITICAL},    {"off", LogLevel::OFF},
    {"none", LogLevel::OFF},
};

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

void init_logging(LogLevel level, const std::string& pattern) {
    // stdout_color_mt throws if the name is already registered
    auto console = spdlog::get(kLoggerName);
    if (!console) {
        console = spdlog::stdout_color_mt(kLoggerName);
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(to_spdlog_level(level));
    spdlog::set_pattern(pattern.empty() ? kDefaultPattern : pattern);
}

const char* log_level_name(LogLevel level) {
    for (const auto& [name, value] : kLevelNames) {
        if (value == level) {
            return name;
        }
    }
    return "info";
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto it = std::find_if(std::begin(kLevelNames), std::end(kLevelNames),
                           [&lower](const auto& entry) { return lower == entry.first; });
    if (it == std::end(kLevelNames)) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace framecast::utils
