/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef DMA_H
#define DMA_H

#include <atomic>
#include <memory>

#include <boost/lockfree/stack.hpp>

#include <nvmecore/types.h>

namespace dma {

enum class direction {
    bidirectional,
    to_device,
    from_device,
};

// Returned by map_page() when no device address could be obtained
constexpr u64 mapping_error = ~0ULL;

// One entry of a host scatter-gather list. page/offset/length describe
// host memory, dma_address/dma_length are filled in by map_sg().
struct scatterlist {
    u64 page;
    u32 offset;
    u32 length;
    u64 dma_address;
    u32 dma_length;
};

// DMA services of the bus the controller sits on
class dma_device {
public:
    virtual ~dma_device() {}

    // Zeroed, page aligned memory visible to both CPU and device.
    // Returns nullptr on failure.
    virtual void* alloc_coherent(size_t size, u64* dma_handle) = 0;
    virtual void free_coherent(size_t size, void* vaddr, u64 dma_handle) = 0;

    virtual u64 map_page(u64 page, u32 offset, size_t size, direction dir) = 0;
    virtual void unmap_page(u64 dma_addr, size_t size, direction dir) = 0;

    // Returns the number of mapped entries, 0 on failure
    virtual unsigned map_sg(scatterlist* sg, unsigned nents, direction dir) = 0;
    virtual void unmap_sg(scatterlist* sg, unsigned nents, direction dir) = 0;
};

// Identity mapped bus: device addresses are host physical addresses and
// host memory is linearly mapped, as in a unikernel.
class direct_device : public dma_device {
public:
    virtual void* alloc_coherent(size_t size, u64* dma_handle) override;
    virtual void free_coherent(size_t size, void* vaddr, u64 dma_handle) override;
    virtual u64 map_page(u64 page, u32 offset, size_t size, direction dir) override;
    virtual void unmap_page(u64 dma_addr, size_t size, direction dir) override;
    virtual unsigned map_sg(scatterlist* sg, unsigned nents, direction dir) override;
    virtual void unmap_sg(scatterlist* sg, unsigned nents, direction dir) override;
};

struct dma_page {
    void* vaddr;
    u64 dma;
};

// Pool of equally sized device-visible pages. Freed pages are kept in a
// small lock-free cache so that the submit path rarely reaches the
// underlying allocator.
class dma_pool {
public:
    dma_pool(std::shared_ptr<dma_device> dev, size_t page_size, size_t cache_pages = 16);
    ~dma_pool();

    dma_pool(const dma_pool&) = delete;
    dma_pool& operator=(const dma_pool&) = delete;

    // Returns false when no page could be allocated
    bool alloc(dma_page& page);
    void free(void* vaddr, u64 dma);

    size_t page_size() const { return _page_size; }
    // Pages handed out and not yet returned
    size_t outstanding() const { return _outstanding.load(std::memory_order_relaxed); }
private:
    std::shared_ptr<dma_device> _dev;
    size_t _page_size;
    std::atomic<size_t> _outstanding;
    boost::lockfree::stack<dma_page> _cache;
};

}

#endif
