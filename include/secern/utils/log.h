/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: log.h
 * Description: Level-gated diagnostic logging to stderr. Messages below the
 *              configured level are discarded; data output never goes here.
 */

#pragma once

#include <string>

namespace secern {
namespace utils {

enum class LogLevel {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kOff
};

void set_log_level(LogLevel level);
LogLevel log_level();

// Accepts "debug", "info", "warn", "error" and "off" (case-insensitive)
bool parse_log_level(const std::string& text, LogLevel* level);

// Applies the level named by the SECERN_LOG environment variable, if any.
// Returns false when the variable is set to something unrecognised.
bool apply_log_level_from_env(const char* variable = "SECERN_LOG");

bool log_enabled(LogLevel level);
void log_message(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) { log_message(LogLevel::kDebug, message); }
inline void log_info(const std::string& message) { log_message(LogLevel::kInfo, message); }
inline void log_warn(const std::string& message) { log_message(LogLevel::kWarn, message); }
inline void log_error(const std::string& message) { log_message(LogLevel::kError, message); }

} // namespace utils
} // namespace secern
