/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVMECORE_SPINLOCK_HH
#define NVMECORE_SPINLOCK_HH

#include <atomic>

#include <nvmecore/arch.hh>
#include <nvmecore/irqlock.hh>

namespace nvmecore {

class spinlock {
public:
    void lock() {
        while (_locked.exchange(true, std::memory_order_acquire)) {
            while (_locked.load(std::memory_order_relaxed)) {
#if defined(__x86_64__)
                asm volatile("pause");
#endif
            }
        }
    }
    bool try_lock() {
        return !_locked.exchange(true, std::memory_order_acquire);
    }
    void unlock() {
        _locked.store(false, std::memory_order_release);
    }
private:
    std::atomic<bool> _locked = { false };
};

// Spinlock taken with interrupts disabled on the calling context, so that
// state it protects may also be touched from an interrupt handler. The
// saved interrupt state lives in the lock and is only written while held.
class irq_spinlock {
public:
    void lock() {
        irq_save_lock_type irq;
        irq.lock();
        _lock.lock();
        _irq = irq;
    }
    void unlock() {
        irq_save_lock_type irq = _irq;
        _lock.unlock();
        irq.unlock();
    }
private:
    spinlock _lock;
    irq_save_lock_type _irq;
};

}

#endif /* NVMECORE_SPINLOCK_HH */
