/*
 * Copyright (C) 2013 Cloudius Systems, Ltd.
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVMECORE_IRQLOCK_HH
#define NVMECORE_IRQLOCK_HH

#include <nvmecore/arch.hh>

namespace nvmecore {

// Disables interrupts while held and restores the previous state, so it
// nests inside other interrupt-disabled sections
class irq_save_lock_type {
public:
    void lock();
    void unlock();
private:
    arch::irq_flag _flags;
};

inline void irq_save_lock_type::lock()
{
    _flags.save();
    arch::irq_disable();
}

inline void irq_save_lock_type::unlock()
{
    _flags.restore();
    barrier();
}

}

#endif /* NVMECORE_IRQLOCK_HH */
