/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include <cassert>

#include "drivers/pci-device.hh"

namespace pci {

mmio_bar::mmio_bar(volatile void* addr, u64 size)
    : _addr(static_cast<volatile u8*>(addr))
    , _size(size)
{
}

void mmio_bar::writel(u64 offset, u32 val)
{
    assert(offset + sizeof(u32) <= _size);
    *reinterpret_cast<volatile u32*>(_addr + offset) = val;
}

u32 mmio_bar::readl(u64 offset)
{
    assert(offset + sizeof(u32) <= _size);
    return *reinterpret_cast<volatile u32*>(_addr + offset);
}

}
