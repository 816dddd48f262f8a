/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVME_PRP_H
#define NVME_PRP_H

#include <vector>

#include "drivers/dma.hh"
#include "drivers/nvme-structs.h"

namespace nvme {

// Scatter-gather list and PRP list pages of a request that could not be
// mapped inline. Owned by the request until its completion.
struct mapping_data {
    std::vector<dma::scatterlist> sg;
    // descriptor pages in chain order
    std::vector<dma::dma_page> pages;
};

// PRP stands for Physical Region Page and is used to specify locations in
// physical memory for data transfers. PRP entry 1 of a command always
// points at the first byte of data; PRP entry 2 points at the second
// controller page, or, when more than two pages are involved, at a PRP
// list: a page of addresses of the remaining controller pages. A list
// that does not fit one page is chained, the last slot of each page then
// holding the address of the next one.
//
// Fills in prp1/prp2 of cmd for the first `length` bytes of the first
// sg_count mapped entries of md.sg, allocating list pages from pool into
// md.pages. Returns 0, ENOMEM if the pool ran dry, or EIO if the list
// cannot be expressed with PRPs. Nothing is left allocated on failure.
int setup_prps(dma::dma_pool& pool, nvme_sq_entry_t& cmd, mapping_data& md,
               unsigned sg_count, u32 length, u32& page_count);

// Writes `entries` into a chain of list pages taken from pool. The
// pages are appended to `pages`.
int build_prp_list(dma::dma_pool& pool, const std::vector<u64>& entries,
                   std::vector<dma::dma_page>& pages);

// Returns the page_count list pages starting at first_dma to the pool
void free_prps(u32 page_count, const std::vector<dma::dma_page>& pages, u64 first_dma,
               dma::dma_pool& pool);

// Entries a list page of `page_size` bytes holds
inline unsigned prp_entries_per_page(size_t page_size)
{
    return page_size / sizeof(u64);
}

}

#endif
