#pragma once

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>

#include "export.h"

// Severity of a crockid log message.  The numeric values are the spdlog ones.
typedef enum CROCKID_LOG_LEVEL {
    CROCKID_LOG_LEVEL_TRACE = 0,
    CROCKID_LOG_LEVEL_DEBUG = 1,
    CROCKID_LOG_LEVEL_INFO = 2,
    CROCKID_LOG_LEVEL_WARN = 3,
    CROCKID_LOG_LEVEL_ERROR = 4,
    CROCKID_LOG_LEVEL_CRITICAL = 5,
    CROCKID_LOG_LEVEL_OFF = 6,
} CROCKID_LOG_LEVEL;

/// API: crockid/crockid_add_logger
///
/// Registers a callback for the library's own log messages (rejected identifiers at debug level,
/// entropy failures at critical level).  Messages from other log categories are not delivered.
///
/// Inputs:
/// - `callback` -- [in] invoked with the level and the formatted message (not null-terminated).
CROCKID_EXPORT void crockid_add_logger(
        void (*callback)(CROCKID_LOG_LEVEL level, const char* msg, size_t msglen));

/// API: crockid/crockid_set_log_level
///
/// Sets the minimum level of messages the library emits.  The initial level is the oxen-logging
/// default (info), so rejected identifiers are silent until this is lowered to debug.
CROCKID_EXPORT void crockid_set_log_level(CROCKID_LOG_LEVEL level);

/// API: crockid/crockid_set_log_level_name
///
/// Same as `crockid_set_log_level`, taking the level by name ("trace", "debug", "info",
/// "warning", "error", "critical" or "off", in any case), e.g. straight from a config file.
///
/// Outputs:
/// - `bool` -- false, leaving the level unchanged, if `name` is NULL or not a level name.
CROCKID_EXPORT bool crockid_set_log_level_name(const char* name) CROCKID_WARN_UNUSED;

/// API: crockid/crockid_get_log_level
///
/// Returns the current minimum level of the library's log messages.
CROCKID_EXPORT CROCKID_LOG_LEVEL crockid_get_log_level();

/// API: crockid/crockid_clear_loggers
///
/// Removes every registered log sink.
CROCKID_EXPORT void crockid_clear_loggers();

#ifdef __cplusplus
}
#endif
