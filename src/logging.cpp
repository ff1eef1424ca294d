#include "crockid/logging.hpp"

#include <spdlog/common.h>

#include <memory>
#include <oxen/log.hpp>
#include <oxen/log/formatted_callback_sink.hpp>
#include <stdexcept>
#include <string>

#include "crockid/export.h"
#include "crockid/logging.h"
#include "crockid/util.hpp"

namespace crockid {

namespace log = oxen::log;

static_assert(static_cast<int>(CROCKID_LOG_LEVEL_TRACE) == static_cast<int>(spdlog::level::trace));
static_assert(static_cast<int>(CROCKID_LOG_LEVEL_WARN) == static_cast<int>(spdlog::level::warn));
static_assert(static_cast<int>(CROCKID_LOG_LEVEL_OFF) == static_cast<int>(spdlog::level::off));

namespace {

    log::Level to_oxen(LogLevel level) {
        return static_cast<log::Level>(level.level);
    }

}  // namespace

std::string_view LogLevel::to_string() const {
    return log::to_string(to_oxen(*this));
}

LogLevel LogLevel::from_string(std::string_view name) {
    auto wanted = ascii_upper(name);
    for (int lvl = CROCKID_LOG_LEVEL_TRACE; lvl <= CROCKID_LOG_LEVEL_OFF; ++lvl)
        if (ascii_upper(LogLevel{lvl}.to_string()) == wanted)
            return LogLevel{lvl};
    throw std::invalid_argument{"Invalid log level: " + std::string{name}};
}

void add_logger(log_callback cb) {
    std::function<void(std::string_view, std::string_view, log::Level)> forward =
            [cb = std::move(cb)](
                    std::string_view msg, std::string_view category, log::Level level) {
                if (category == LOG_CATEGORY)
                    cb(LogLevel{static_cast<int>(level)}, msg);
            };
    log::add_sink(std::make_shared<log::formatted_callback_sink>(std::move(forward)));
}

void set_log_level(LogLevel level) {
    log::set_level(std::string{LOG_CATEGORY}, to_oxen(level));
}

LogLevel get_log_level() {
    return LogLevel{static_cast<int>(log::get_level(std::string{LOG_CATEGORY}))};
}

void clear_loggers() {
    log::clear_sinks();
}

}  // namespace crockid

extern "C" {

CROCKID_C_API void crockid_add_logger(
        void (*callback)(CROCKID_LOG_LEVEL level, const char* msg, size_t msglen)) {
    if (!callback)
        return;
    crockid::add_logger([callback](crockid::LogLevel level, std::string_view msg) {
        callback(static_cast<CROCKID_LOG_LEVEL>(level.level), msg.data(), msg.size());
    });
}

CROCKID_C_API void crockid_set_log_level(CROCKID_LOG_LEVEL level) {
    crockid::set_log_level(crockid::LogLevel{level});
}

CROCKID_C_API bool crockid_set_log_level_name(const char* name) {
    if (!name)
        return false;
    try {
        crockid::set_log_level(crockid::LogLevel::from_string(name));
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

CROCKID_C_API CROCKID_LOG_LEVEL crockid_get_log_level() {
    return static_cast<CROCKID_LOG_LEVEL>(crockid::get_log_level().level);
}

CROCKID_C_API void crockid_clear_loggers() {
    crockid::clear_loggers();
}

}  // extern "C"
