/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVMECORE_INTERRUPT_HH
#define NVMECORE_INTERRUPT_HH

#include <functional>
#include <memory>
#include <string>

namespace nvmecore {

// Return value of an interrupt handler: whether the interrupt was ours
enum class irq_return {
    none,
    handled,
};

using irq_handler = std::function<irq_return ()>;

// Owns one registered interrupt handler. Destroying the registration
// detaches the handler; this may block waiting for a running handler to
// finish, so it must not be destroyed with a spinlock held.
class interrupt_registration {
public:
    virtual ~interrupt_registration() {}
    virtual unsigned vector() const = 0;
    virtual const std::string& name() const = 0;
};

}

#endif /* NVMECORE_INTERRUPT_HH */
