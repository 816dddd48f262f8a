/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include <cstdlib>
#include <cstring>

#include <nvmecore/align.hh>

#include "drivers/dma.hh"

namespace dma {

static constexpr size_t coherent_alignment = 4096;

void* direct_device::alloc_coherent(size_t size, u64* dma_handle)
{
    size_t aligned = align_up(size, coherent_alignment);
    void* addr = aligned_alloc(coherent_alignment, aligned);
    if (!addr) {
        return nullptr;
    }
    memset(addr, 0, aligned);
    *dma_handle = reinterpret_cast<u64>(addr);
    return addr;
}

void direct_device::free_coherent(size_t size, void* vaddr, u64 dma_handle)
{
    ::free(vaddr);
}

u64 direct_device::map_page(u64 page, u32 offset, size_t size, direction dir)
{
    return page + offset;
}

void direct_device::unmap_page(u64 dma_addr, size_t size, direction dir)
{
}

unsigned direct_device::map_sg(scatterlist* sg, unsigned nents, direction dir)
{
    for (unsigned i = 0; i < nents; i++) {
        sg[i].dma_address = sg[i].page + sg[i].offset;
        sg[i].dma_length = sg[i].length;
    }
    return nents;
}

void direct_device::unmap_sg(scatterlist* sg, unsigned nents, direction dir)
{
}

dma_pool::dma_pool(std::shared_ptr<dma_device> dev, size_t page_size, size_t cache_pages)
    : _dev(std::move(dev))
    , _page_size(page_size)
    , _outstanding(0)
    , _cache(cache_pages)
{
}

dma_pool::~dma_pool()
{
    dma_page page;
    while (_cache.pop(page)) {
        _dev->free_coherent(_page_size, page.vaddr, page.dma);
    }
}

bool dma_pool::alloc(dma_page& page)
{
    if (!_cache.pop(page)) {
        page.vaddr = _dev->alloc_coherent(_page_size, &page.dma);
        if (!page.vaddr) {
            return false;
        }
    }
    _outstanding.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void dma_pool::free(void* vaddr, u64 dma)
{
    _outstanding.fetch_sub(1, std::memory_order_relaxed);
    if (!_cache.bounded_push(dma_page{vaddr, dma})) {
        _dev->free_coherent(_page_size, vaddr, dma);
    }
}

}
