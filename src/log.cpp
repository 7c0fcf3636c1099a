// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors

#include <ddcp/log.hpp>

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>

namespace ddcp {

namespace {

std::mutex log_mutex;
LogHandler log_handler_fn;

} // namespace

void set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_handler_fn = std::move(handler);
}

void clear_log_handler() noexcept {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_handler_fn = nullptr;
}

void log_emit(LogLevel level, std::string_view msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_handler_fn) {
        log_handler_fn(level, msg);
    }
}

void log_emitf(LogLevel level, const char *fmt, ...) {
    {
        // Fast path: nothing to format for
        std::lock_guard<std::mutex> lock(log_mutex);
        if (!log_handler_fn) return;
    }

    char buf[512];
    va_list ap;
    va_start(ap, fmt);
    int n = vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    if (n < 0) return;

    log_emit(level, std::string_view(buf, static_cast<size_t>(n) < sizeof(buf)
                                              ? static_cast<size_t>(n)
                                              : sizeof(buf) - 1));
}

} // namespace ddcp
