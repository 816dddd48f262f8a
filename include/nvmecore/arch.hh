/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVMECORE_ARCH_HH
#define NVMECORE_ARCH_HH

#include <atomic>

#include <nvmecore/counters.hh>

namespace nvmecore {

// Compiler-only barrier
inline void barrier()
{
    std::atomic_signal_fence(std::memory_order_seq_cst);
}

namespace arch {

// Orders prior stores to device-visible memory before later ones.
inline void wmb()
{
#if defined(__x86_64__)
    asm volatile("sfence" ::: "memory");
#else
    std::atomic_thread_fence(std::memory_order_release);
#endif
}

// Full barrier; orders stores against later loads.
inline void mb()
{
#if defined(__x86_64__)
    asm volatile("mfence" ::: "memory");
#else
    std::atomic_thread_fence(std::memory_order_seq_cst);
#endif
}

inline void irq_disable()
{
    ++irq_counters.irq;
    barrier();
}

class irq_flag {
public:
    void save() {
        _depth = irq_counters.irq;
    }
    void restore() {
        irq_counters.irq = _depth;
    }
private:
    u16 _depth = 0;
};

}
}

#endif /* NVMECORE_ARCH_HH */
