/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include <algorithm>
#include <cerrno>

#include <nvmecore/trace.hh>

#include "drivers/nvme-debug.hh"
#include "drivers/nvme-prp.hh"
#include "drivers/nvme-queue.hh"

TRACEPOINT(trace_nvme_prp_list, "entries=%u pages=%u first=%#lx", unsigned, unsigned, u64);
TRACEPOINT(trace_nvme_prp_bad_sgl, "sg_count=%u length=%u", unsigned, unsigned);

namespace nvme {

int build_prp_list(dma::dma_pool& pool, const std::vector<u64>& entries,
                   std::vector<dma::dma_page>& pages)
{
    const unsigned capacity = prp_entries_per_page(pool.page_size());
    // once the list spans several pages the last slot of each is a link
    const unsigned per_page = entries.size() > capacity ? capacity - 1 : capacity;
    const size_t first = pages.size();

    u64* prev = nullptr;
    for (size_t i = 0; i < entries.size(); ) {
        dma::dma_page page;
        if (!pool.alloc(page)) {
            for (size_t j = first; j < pages.size(); j++) {
                pool.free(pages[j].vaddr, pages[j].dma);
            }
            pages.resize(first);
            return ENOMEM;
        }
        if (prev) {
            prev[capacity - 1] = page.dma;
        }
        auto list = static_cast<u64*>(page.vaddr);
        size_t n = std::min<size_t>(per_page, entries.size() - i);
        std::copy(entries.begin() + i, entries.begin() + i + n, list);
        i += n;
        pages.push_back(page);
        prev = list;
    }
    return 0;
}

static int bad_sgl(unsigned sg_count, u32 length)
{
    NVME_ERROR("Invalid SGL for payload:%u nents:%u\n", length, sg_count);
    trace_nvme_prp_bad_sgl(sg_count, length);
    return EIO;
}

// Every segment but the first starts on a controller page and every
// segment but the last ends on one. dma_len < left at the end means the
// data ran past the segment holding it.
int setup_prps(dma::dma_pool& pool, nvme_sq_entry_t& cmd, mapping_data& md,
               unsigned sg_count, u32 length, u32& page_count)
{
    const s64 page_size = NVME_CTRL_PAGE_SIZE;
    unsigned idx = 0;
    u64 dma_addr = md.sg[0].dma_address;
    s64 dma_len = md.sg[0].dma_length;
    s64 left = length;
    s64 offset = dma_addr & (page_size - 1);

    page_count = 0;
    cmd.common.prp1 = dma_addr;
    cmd.common.prp2 = 0;

    left -= page_size - offset;
    dma_len -= page_size - offset;
    if (left <= 0) {
        return dma_len < left ? bad_sgl(sg_count, length) : 0;
    }

    if (dma_len > 0) {
        dma_addr += page_size - offset;
    } else {
        if (dma_len < 0 || ++idx == sg_count) {
            return bad_sgl(sg_count, length);
        }
        dma_addr = md.sg[idx].dma_address;
        dma_len = md.sg[idx].dma_length;
        if (dma_addr & (page_size - 1)) {
            return bad_sgl(sg_count, length);
        }
    }

    if (left <= page_size) {
        if (dma_len < left) {
            return bad_sgl(sg_count, length);
        }
        cmd.common.prp2 = dma_addr;
        return 0;
    }

    std::vector<u64> entries;
    entries.reserve((left + page_size - 1) / page_size);
    while (true) {
        entries.push_back(dma_addr);
        dma_len -= page_size;
        dma_addr += page_size;
        left -= page_size;
        if (left <= 0) {
            if (dma_len < left) {
                return bad_sgl(sg_count, length);
            }
            break;
        }
        if (dma_len > 0) {
            continue;
        }
        if (dma_len < 0 || ++idx == sg_count) {
            return bad_sgl(sg_count, length);
        }
        dma_addr = md.sg[idx].dma_address;
        dma_len = md.sg[idx].dma_length;
        if (dma_addr & (page_size - 1)) {
            return bad_sgl(sg_count, length);
        }
    }

    int ret = build_prp_list(pool, entries, md.pages);
    if (ret) {
        return ret;
    }
    page_count = md.pages.size();
    cmd.common.prp2 = md.pages[0].dma;
    trace_nvme_prp_list(entries.size(), page_count, md.pages[0].dma);
    return 0;
}

void free_prps(u32 page_count, const std::vector<dma::dma_page>& pages, u64 first_dma,
               dma::dma_pool& pool)
{
    const unsigned capacity = prp_entries_per_page(pool.page_size());
    u64 dma_addr = first_dma;
    for (u32 i = 0; i < page_count; i++) {
        auto list = static_cast<u64*>(pages[i].vaddr);
        u64 next = list[capacity - 1];
        pool.free(pages[i].vaddr, dma_addr);
        dma_addr = next;
    }
}

}
