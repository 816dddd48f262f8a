/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

#include <nvmecore/debug.hh>
#include <nvmecore/mutex.hh>
#include <nvmecore/printf.hh>

namespace nvmecore {

static std::atomic<int> log_level = { logger_info };

static std::mutex sink_lock;

static void stderr_sink(const std::string& line)
{
    fprintf(stderr, "%s\n", line.c_str());
}

static log_sink& current_sink()
{
    static log_sink sink = stderr_sink;
    return sink;
}

static const char severity_letter[] = { 'D', 'I', 'W', 'E' };

void set_log_level(logger_severity severity)
{
    log_level.store(severity, std::memory_order_relaxed);
}

logger_severity get_log_level()
{
    return static_cast<logger_severity>(log_level.load(std::memory_order_relaxed));
}

bool is_loggable(logger_severity severity)
{
    return severity != logger_none &&
           severity >= log_level.load(std::memory_order_relaxed);
}

bool parse_log_level(const std::string& name, logger_severity& severity)
{
    static const struct {
        const char* name;
        logger_severity severity;
    } levels[] = {
        { "debug", logger_debug },
        { "info", logger_info },
        { "warn", logger_warn },
        { "error", logger_error },
        { "none", logger_none },
    };
    for (auto& l : levels) {
        if (name == l.name) {
            severity = l.severity;
            return true;
        }
    }
    return false;
}

log_sink set_log_sink(log_sink sink)
{
    SCOPE_LOCK(sink_lock);
    auto old = current_sink();
    current_sink() = sink ? std::move(sink) : log_sink(stderr_sink);
    return old;
}

void tprintf(const char* tag, logger_severity severity, const char* fmt, ...)
{
    if (!is_loggable(severity)) {
        return;
    }

    va_list ap;
    va_start(ap, fmt);
    auto msg = vsprintf(fmt, ap);
    va_end(ap);

    // drop a trailing newline, the sink adds its own
    if (!msg.empty() && msg.back() == '\n') {
        msg.pop_back();
    }

    auto line = nvmecore::sprintf("[%s %c] ", tag, severity_letter[severity]) + msg;
    SCOPE_LOCK(sink_lock);
    current_sink()(line);
}

}
