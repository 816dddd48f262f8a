/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVMECORE_DEBUG_HH
#define NVMECORE_DEBUG_HH

#include <functional>
#include <string>

namespace nvmecore {

enum logger_severity {
    logger_debug = 0,
    logger_info,
    logger_warn,
    logger_error,
    logger_none,
};

// Tagged log line, emitted only when severity is at or above the global
// log level. Lines are handed to the sink without a trailing newline.
void tprintf(const char* tag, logger_severity severity, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

void set_log_level(logger_severity severity);
logger_severity get_log_level();
bool is_loggable(logger_severity severity);

// Parses "debug", "info", "warn", "error" or "none". Returns false if the
// name is unknown.
bool parse_log_level(const std::string& name, logger_severity& severity);

using log_sink = std::function<void (const std::string& line)>;

// Replaces the sink and returns the previous one. An empty sink restores
// the default (stderr).
log_sink set_log_sink(log_sink sink);

}

#define tprintf_d(tag, ...) nvmecore::tprintf(tag, nvmecore::logger_debug, __VA_ARGS__)
#define tprintf_i(tag, ...) nvmecore::tprintf(tag, nvmecore::logger_info, __VA_ARGS__)
#define tprintf_w(tag, ...) nvmecore::tprintf(tag, nvmecore::logger_warn, __VA_ARGS__)
#define tprintf_e(tag, ...) nvmecore::tprintf(tag, nvmecore::logger_error, __VA_ARGS__)

#endif /* NVMECORE_DEBUG_HH */
