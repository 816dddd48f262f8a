/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef PCI_DEVICE_H
#define PCI_DEVICE_H

#include <memory>
#include <string>

#include <nvmecore/types.h>
#include <nvmecore/interrupt.hh>

namespace pci {

// Register window of a mapped BAR
class bar {
public:
    virtual ~bar() {}
    virtual void writel(u64 offset, u32 val) = 0;
    virtual u32 readl(u64 offset) = 0;
    virtual u64 size() const = 0;
};

// BAR mapped into our address space; accesses go straight to the window
class mmio_bar : public bar {
public:
    mmio_bar(volatile void* addr, u64 size);
    virtual void writel(u64 offset, u32 val) override;
    virtual u32 readl(u64 offset) override;
    virtual u64 size() const override { return _size; }
private:
    volatile u8* _addr;
    u64 _size;
};

// The bus-side view of the controller the queues need: interrupt vectors
class device {
public:
    virtual ~device() {}
    // Returns nullptr if the vector could not be registered
    virtual std::unique_ptr<nvmecore::interrupt_registration>
    request_irq(unsigned vector, nvmecore::irq_handler handler,
                const std::string& name) = 0;
    virtual unsigned msix_vectors() const = 0;
};

}

#endif
