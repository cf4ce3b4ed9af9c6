/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: log.cc
 * Description: Implementation of the stderr logger. Each record is a single
 *              line carrying a UTC timestamp, the level and the program name.
 */

#include "secern/utils/log.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace secern {
namespace utils {

namespace {
    LogLevel g_level = LogLevel::kInfo;

    const char* level_name(LogLevel level) {
        switch (level) {
            case LogLevel::kDebug: return "DEBUG";
            case LogLevel::kInfo:  return "INFO ";
            case LogLevel::kWarn:  return "WARN ";
            case LogLevel::kError: return "ERROR";
            case LogLevel::kOff:   break;
        }
        return "";
    }

    std::string utc_timestamp() {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_utc{};
        gmtime_r(&now, &tm_utc);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
        return buf;
    }
}

void set_log_level(LogLevel level) {
    g_level = level;
}

LogLevel log_level() {
    return g_level;
}

bool parse_log_level(const std::string& text, LogLevel* level) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        *level = LogLevel::kDebug;
    } else if (lowered == "info") {
        *level = LogLevel::kInfo;
    } else if (lowered == "warn") {
        *level = LogLevel::kWarn;
    } else if (lowered == "error") {
        *level = LogLevel::kError;
    } else if (lowered == "off") {
        *level = LogLevel::kOff;
    } else {
        return false;
    }
    return true;
}

bool apply_log_level_from_env(const char* variable) {
    const char* value = std::getenv(variable);
    if (value == nullptr || *value == '\0') {
        return true;
    }
    LogLevel level;
    if (!parse_log_level(value, &level)) {
        return false;
    }
    set_log_level(level);
    return true;
}

bool log_enabled(LogLevel level) {
    return level != LogLevel::kOff && level >= g_level;
}

void log_message(LogLevel level, const std::string& message) {
    if (!log_enabled(level)) {
        return;
    }
    std::cerr << "[" << utc_timestamp() << " " << level_name(level) << " secern] "
              << message << std::endl;
}

} // namespace utils
} // namespace secern
