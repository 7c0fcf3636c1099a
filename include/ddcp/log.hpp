// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file log.hpp
 * @brief Logging interface for ddcp
 *
 * The log handler is process-wide and thread-safe. With no handler
 * installed the library is silent: it never writes diagnostics to
 * stderr on its own.
 *
 * Example:
 * @code
 *   ddcp::set_log_handler([](ddcp::LogLevel level, std::string_view msg) {
 *       std::cerr << "[" << ddcp::log_level_name(level) << "] " << msg << "\n";
 *   });
 *
 *   ddcp::log_emit(ddcp::LogLevel::Info, "copy started");
 *   // ... library and app logs dispatched to the handler ...
 *
 *   ddcp::clear_log_handler();
 * @endcode
 */

#ifndef DDCP_LOG_HPP
#define DDCP_LOG_HPP

#include <functional>
#include <string_view>

namespace ddcp {

/// Log severity levels (match syslog priorities 1:1)
enum class LogLevel {
    Error = 3,   ///< Error condition
    Warning = 4, ///< Warning condition
    Notice = 5,  ///< Normal but significant
    Info = 6,    ///< Informational
    Debug = 7    ///< Debug-level
};

/// Return a short name for the given log level ("ERR", "WARN", etc.)
[[nodiscard]] inline const char *log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Notice:
        return "NOTICE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    default:
        return "???";
    }
}

/// Log handler callback type
using LogHandler = std::function<void(LogLevel, std::string_view)>;

/// Install a process-wide log handler.
///
/// Replaces any previously installed handler.  The handler is called from
/// whichever thread emits the log message; it must be thread-safe.
void set_log_handler(LogHandler handler);

/// Remove the current log handler.
///
/// After this call the library is silent (default state).
void clear_log_handler() noexcept;

/// Emit a log message through the registered handler (if any).
///
/// No-op when no handler is installed.  Thread-safe.
void log_emit(LogLevel level, std::string_view msg);

/// printf-style variant of log_emit(); formatting is skipped when no
/// handler is installed.
void log_emitf(LogLevel level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace ddcp

#endif // DDCP_LOG_HPP
