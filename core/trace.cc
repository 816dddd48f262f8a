/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include <algorithm>
#include <fnmatch.h>
#include <mutex>

#include <nvmecore/debug.hh>
#include <nvmecore/mutex.hh>
#include <nvmecore/trace.hh>

namespace nvmecore {

namespace {

struct registry {
    std::mutex lock;
    std::vector<tracepoint_base*> tracepoints;
};

// Tracepoints are namespace-scope statics spread over several
// translation units, so the registry must exist before any of them.
registry& tracepoint_registry()
{
    static registry r;
    return r;
}

}

tracepoint_base::tracepoint_base(const char* name, const char* format)
    : _name(name), _format(format)
{
    auto& r = tracepoint_registry();
    SCOPE_LOCK(r.lock);
    r.tracepoints.push_back(this);
}

tracepoint_base::~tracepoint_base()
{
    auto& r = tracepoint_registry();
    SCOPE_LOCK(r.lock);
    auto& tps = r.tracepoints;
    tps.erase(std::remove(tps.begin(), tps.end(), this), tps.end());
}

void tracepoint_base::emit(const char* text)
{
    _hits.fetch_add(1, std::memory_order_relaxed);
    tprintf_d("trace", "%s: %s", _name, text);
}

unsigned enable_tracepoints(const std::string& pattern, bool on)
{
    auto& r = tracepoint_registry();
    SCOPE_LOCK(r.lock);
    unsigned n = 0;
    for (auto tp : r.tracepoints) {
        if (fnmatch(pattern.c_str(), tp->name(), 0) == 0) {
            tp->enable(on);
            ++n;
        }
    }
    return n;
}

tracepoint_base* find_tracepoint(const std::string& name)
{
    auto& r = tracepoint_registry();
    SCOPE_LOCK(r.lock);
    for (auto tp : r.tracepoints) {
        if (name == tp->name()) {
            return tp;
        }
    }
    return nullptr;
}

std::vector<tracepoint_base*> list_tracepoints()
{
    auto& r = tracepoint_registry();
    SCOPE_LOCK(r.lock);
    return r.tracepoints;
}

}
