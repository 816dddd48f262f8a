/*
 * Copyright (C) 2020 Waldemar Kozaczuk
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVMECORE_COUNTERS_HH
#define NVMECORE_COUNTERS_HH

#include <nvmecore/types.h>

namespace nvmecore {
namespace arch {

// Per-thread nesting depth of interrupt-disabled sections and of
// interrupt handlers
struct counters {
    u16 irq;
    u16 in_irq_handler;
};

extern thread_local counters irq_counters;

inline bool irqs_disabled()
{
    return irq_counters.irq != 0;
}

inline bool in_irq_handler()
{
    return irq_counters.in_irq_handler != 0;
}

// Marks the current thread as running an interrupt handler for the
// guard's lifetime.
class irq_handler_guard {
public:
    irq_handler_guard() {
        ++irq_counters.in_irq_handler;
    }
    ~irq_handler_guard() {
        --irq_counters.in_irq_handler;
    }
    irq_handler_guard(const irq_handler_guard&) = delete;
    irq_handler_guard& operator=(const irq_handler_guard&) = delete;
};

}
}

#endif //NVMECORE_COUNTERS_HH
