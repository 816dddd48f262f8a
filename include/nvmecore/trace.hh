/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVMECORE_TRACE_HH
#define NVMECORE_TRACE_HH

#include <atomic>
#include <cstdio>
#include <string>
#include <vector>

#include <nvmecore/types.h>

namespace nvmecore {

class tracepoint_base {
public:
    tracepoint_base(const char* name, const char* format);
    ~tracepoint_base();
    tracepoint_base(const tracepoint_base&) = delete;
    tracepoint_base& operator=(const tracepoint_base&) = delete;

    const char* name() const { return _name; }
    const char* format() const { return _format; }
    bool enabled() const { return _enabled.load(std::memory_order_relaxed); }
    void enable(bool on = true) { _enabled.store(on, std::memory_order_relaxed); }
    u64 hits() const { return _hits.load(std::memory_order_relaxed); }
protected:
    void emit(const char* text);
private:
    const char* _name;
    const char* _format;
    std::atomic<bool> _enabled = { false };
    std::atomic<u64> _hits = { 0 };
};

template <typename... Args>
class tracepoint : public tracepoint_base {
public:
    using tracepoint_base::tracepoint_base;

    void operator()(Args... as) {
        if (!enabled()) {
            return;
        }
        char buf[256];
        snprintf(buf, sizeof(buf), format(), as...);
        emit(buf);
    }
};

// Enables (or disables) every registered tracepoint whose name matches
// the shell glob `pattern`. Returns the number of tracepoints affected.
unsigned enable_tracepoints(const std::string& pattern, bool on = true);

tracepoint_base* find_tracepoint(const std::string& name);
std::vector<tracepoint_base*> list_tracepoints();

}

#define TRACEPOINT(name, fmt, ...) \
    static nvmecore::tracepoint<__VA_ARGS__> name(#name, fmt)

#endif /* NVMECORE_TRACE_HH */
