#pragma once

#include <functional>
#include <string_view>

#include "logging.h"

namespace crockid {

/// Name of the oxen-logging category all library messages are written to.
inline constexpr std::string_view LOG_CATEGORY = "crockid";

/// Level of a library log message; the same values as `CROCKID_LOG_LEVEL`, ordered by severity.
struct LogLevel {
    int level;

    explicit constexpr LogLevel(int lvl) : level{lvl} {}

    /// Lower case name: "trace", "debug", "info", "warning", "error", "critical" or "off".
    std::string_view to_string() const;

    /// Inverse of `to_string`, ignoring case.  Throws std::invalid_argument for unknown names.
    static LogLevel from_string(std::string_view name);

    static const LogLevel trace;
    static const LogLevel debug;
    static const LogLevel info;
    static const LogLevel warn;
    static const LogLevel error;
    static const LogLevel critical;
    static const LogLevel off;

    auto operator<=>(const LogLevel& other) const { return level <=> other.level; }
    bool operator==(const LogLevel& other) const { return level == other.level; }
};

inline const LogLevel LogLevel::trace{CROCKID_LOG_LEVEL_TRACE};
inline const LogLevel LogLevel::debug{CROCKID_LOG_LEVEL_DEBUG};
inline const LogLevel LogLevel::info{CROCKID_LOG_LEVEL_INFO};
inline const LogLevel LogLevel::warn{CROCKID_LOG_LEVEL_WARN};
inline const LogLevel LogLevel::error{CROCKID_LOG_LEVEL_ERROR};
inline const LogLevel LogLevel::critical{CROCKID_LOG_LEVEL_CRITICAL};
inline const LogLevel LogLevel::off{CROCKID_LOG_LEVEL_OFF};

using log_callback = std::function<void(LogLevel level, std::string_view msg)>;

/// API: crockid/add_logger
///
/// Adds an oxen-logging sink that forwards the library's own messages, formatted with the usual
/// timestamp/category prefix, to `cb`.  Messages logged under any other category are skipped.
void add_logger(log_callback cb);

/// API: crockid/set_log_level
///
/// Sets the level of the `crockid` log category, e.g. `set_log_level(LogLevel::debug)` to see why
/// identifiers are being rejected.
void set_log_level(LogLevel level);

LogLevel get_log_level();

/// Removes all oxen-logging sinks, including ones not added through `add_logger`.
void clear_loggers();

}  // namespace crockid
