/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include <cerrno>

#include <nvmecore/align.hh>
#include <nvmecore/mutex.hh>

#include "drivers/nvme-debug.hh"
#include "drivers/nvme-device.hh"
#include "drivers/nvme-queue.hh"

namespace nvme {

device_data::device_data(int instance, std::shared_ptr<pci::bar> bar,
                         std::shared_ptr<dma::dma_device> dma, u32 db_stride,
                         const driver_options& opts)
    : _instance(instance)
    , _bar_owner(std::move(bar))
    , _bar(_bar_owner.get())
    , _dma(std::move(dma))
    , _dma_pool(std::make_shared<dma::dma_pool>(_dma, NVME_CTRL_PAGE_SIZE))
    , _db_stride(db_stride)
    , _opts(opts)
{
}

device_data::~device_data()
{
    free_shadow_doorbells();
}

void device_data::detach_resources()
{
    _bar.store(nullptr, std::memory_order_release);
}

int device_data::alloc_shadow_doorbells(unsigned nr_queues)
{
    if (_shadow) {
        return 0;
    }

    // one SQ tail and one CQ head slot per queue, a stride apart
    size_t size = align_up<size_t>(size_t(nr_queues) * 2 * _db_stride, NVME_CTRL_PAGE_SIZE);
    std::unique_ptr<dbbuf> buf(new dbbuf());
    u64 dma_addr;
    buf->dbs = static_cast<volatile u32*>(_dma->alloc_coherent(size, &dma_addr));
    if (!buf->dbs) {
        NVME_ERROR("nvme%d: failed to allocate shadow doorbells\n", _instance);
        return ENOMEM;
    }
    buf->dbs_dma = dma_addr;
    buf->eis = static_cast<volatile u32*>(_dma->alloc_coherent(size, &dma_addr));
    if (!buf->eis) {
        _dma->free_coherent(size, const_cast<u32*>(buf->dbs), buf->dbs_dma);
        NVME_ERROR("nvme%d: failed to allocate event indices\n", _instance);
        return ENOMEM;
    }
    buf->eis_dma = dma_addr;
    buf->size = size;
    buf->entries = size / sizeof(u32);
    _shadow = std::move(buf);
    nvme_i("nvme%d: shadow doorbells enabled for %u queues\n", _instance, nr_queues);
    return 0;
}

void device_data::free_shadow_doorbells()
{
    if (!_shadow) {
        return;
    }
    _dma->free_coherent(_shadow->size, const_cast<u32*>(_shadow->dbs), _shadow->dbs_dma);
    _dma->free_coherent(_shadow->size, const_cast<u32*>(_shadow->eis), _shadow->eis_dma);
    _shadow.reset();
}

void device_data::set_admin_queue(const std::shared_ptr<admin_queue>& q)
{
    SCOPE_LOCK(_queues_lock);
    _queues.admin = q;
}

std::shared_ptr<admin_queue> device_data::get_admin_queue()
{
    SCOPE_LOCK(_queues_lock);
    return _queues.admin.lock();
}

void device_data::add_io_queue(const std::shared_ptr<io_queue>& q)
{
    SCOPE_LOCK(_queues_lock);
    _queues.io.push_back(q);
}

std::shared_ptr<io_queue> device_data::get_io_queue(unsigned idx)
{
    SCOPE_LOCK(_queues_lock);
    if (idx >= _queues.io.size()) {
        return nullptr;
    }
    return _queues.io[idx].lock();
}

unsigned device_data::nr_io_queues()
{
    SCOPE_LOCK(_queues_lock);
    return _queues.io.size();
}

void device_data::clear_io_queues()
{
    SCOPE_LOCK(_queues_lock);
    _queues.io.clear();
}

void device_data::clear_queues()
{
    SCOPE_LOCK(_queues_lock);
    _queues.admin.reset();
    _queues.io.clear();
}

void device_data::set_queue_counts(unsigned irq_queues, unsigned poll_queues)
{
    _irq_queue_count = irq_queues;
    _poll_queue_count = poll_queues;
}

}
