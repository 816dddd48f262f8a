/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVME_MQ_H
#define NVME_MQ_H

#include <atomic>
#include <memory>

#include "drivers/blk-mq.hh"
#include "drivers/dma.hh"
#include "drivers/nvme-device.hh"
#include "drivers/nvme-prp.hh"
#include "drivers/nvme-queue.hh"
#include "drivers/nvme-structs.h"

namespace nvme {

// Driver data of one request slot. The submitting context fills the
// fields in before the command reaches the ring, the completing context
// reads them once; the atomics carry that handoff.
struct nvme_request {
    explicit nvme_request(const std::shared_ptr<device_data>& data);
    ~nvme_request();

    nvme_request(const nvme_request&) = delete;
    nvme_request& operator=(const nvme_request&) = delete;

    // Inline mapping, dma::mapping_error when there is none
    std::atomic<u64> dma_addr;
    std::atomic<u32> result;
    // completion status with the phase bit stripped
    std::atomic<u16> status;
    std::atomic<dma::direction> direction;
    std::atomic<u32> len;
    std::atomic<u32> sg_count;
    std::atomic<u32> page_count;
    std::atomic<u64> first_dma;

    std::shared_ptr<device_data> dev;
    std::shared_ptr<dma::dma_pool> dma_pool;

    // Command submitted for this slot. Passthrough requests carry the
    // caller's command here.
    nvme_sq_entry_t cmd;

    void set_mapping(std::unique_ptr<mapping_data> md);
    std::unique_ptr<mapping_data> take_mapping();
private:
    std::atomic<mapping_data*> _mapping;
};

// Operations of the admin queue: passthrough only, a single hardware
// context, completions by interrupt
struct admin_queue_ops {
    using request_data = nvme_request;
    using queue_data = nvme_ns_t;
    using hw_data = std::shared_ptr<admin_queue>;
    using tagset_data = std::shared_ptr<device_data>;
    using request = blk::request<admin_queue_ops>;
    static constexpr bool has_poll = false;

    static nvme_request new_request_data(const tagset_data& data);
    static int init_hctx(const tagset_data& data, unsigned hctx_idx, hw_data& hw);
    static int queue_rq(const hw_data& q, nvme_ns_t& ns, request& rq, bool is_last);
    static void complete(request& rq);
    static void commit_rqs(const hw_data& q);
    static int map_queues(const tagset_data& data, blk::queue_mapper& mapper);
};

// Operations of the I/O queues: one hardware context per queue, the
// polled ones reaped through poll()
struct io_queue_ops {
    using request_data = nvme_request;
    using queue_data = nvme_ns_t;
    using hw_data = std::shared_ptr<io_queue>;
    using tagset_data = std::shared_ptr<device_data>;
    using request = blk::request<io_queue_ops>;
    static constexpr bool has_poll = true;

    static nvme_request new_request_data(const tagset_data& data);
    static int init_hctx(const tagset_data& data, unsigned hctx_idx, hw_data& hw);
    static int queue_rq(const hw_data& q, nvme_ns_t& ns, request& rq, bool is_last);
    static void complete(request& rq);
    static void commit_rqs(const hw_data& q);
    static int poll(const hw_data& q);
    static int map_queues(const tagset_data& data, blk::queue_mapper& mapper);
};

using admin_tag_set = blk::tag_set<admin_queue_ops>;
using io_tag_set = blk::tag_set<io_queue_ops>;

extern template class queue_pair<admin_queue_ops>;
extern template class queue_pair<io_queue_ops>;

}

#endif
