#pragma once

#include "logger.hpp"

namespace ssebus::log {

/// File name without its directories, resolved at compile time
constexpr const char* source_name(const char* path) noexcept {
    const char* name = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            name = p + 1;
        }
    }
    return name;
}

} // namespace ssebus::log

/// Log through the process-wide logger, tagged with file and line
///
/// Arguments are only evaluated when `lvl` passes the logger's threshold, so
/// call sites on the per-frame path cost a level check when filtered out.
#define SSEBUS_LOG_AT(lvl, ...) \
    do { \
        auto& ssebus_logger_ = ::ssebus::log::logger::instance(); \
        if (ssebus_logger_.enabled(lvl)) { \
            constexpr const char* ssebus_file_ = ::ssebus::log::source_name(__FILE__); \
            ssebus_logger_.log(lvl, ssebus_file_, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#ifdef SSEBUS_DEBUG
    #define SSEBUS_LOG_DEBUG(...) SSEBUS_LOG_AT(::ssebus::log::level::debug, __VA_ARGS__)
#else
    #define SSEBUS_LOG_DEBUG(...) do {} while (0)
#endif

#define SSEBUS_LOG_INFO(...)    SSEBUS_LOG_AT(::ssebus::log::level::info, __VA_ARGS__)
#define SSEBUS_LOG_WARNING(...) SSEBUS_LOG_AT(::ssebus::log::level::warning, __VA_ARGS__)
#define SSEBUS_LOG_ERROR(...)   SSEBUS_LOG_AT(::ssebus::log::level::error, __VA_ARGS__)
