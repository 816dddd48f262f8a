/*
 * Copyright (C) 2023 Jan Braunwarth
 * Copyright (C) 2024 Waldemar Kozaczuk
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVME_DRIVER_H
#define NVME_DRIVER_H

#include <map>
#include <memory>
#include <vector>

#include "drivers/blk-mq.hh"
#include "drivers/dma.hh"
#include "drivers/nvme-device.hh"
#include "drivers/nvme-mq.hh"
#include "drivers/nvme-options.hh"
#include "drivers/nvme-queue.hh"
#include "drivers/nvme-structs.h"
#include "drivers/pci-device.hh"

namespace nvme {

using admin_end_io = blk::end_io_fn<admin_queue_ops>;
using io_end_io = blk::end_io_fn<io_queue_ops>;

// Queue side of one controller. Bringing the controller up (register
// programming, identify, queue creation commands) is left to the caller;
// this class provisions the host side of the queues and routes requests
// to them.
class driver {
public:
    driver(pci::device& dev, std::shared_ptr<pci::bar> bar,
           std::shared_ptr<dma::dma_device> dma, u32 doorbell_stride,
           const driver_options& opts = driver_options());
    ~driver();

    driver(const driver&) = delete;
    driver& operator=(const driver&) = delete;

    int instance() const { return _id; }
    const std::shared_ptr<device_data>& data() const { return _data; }

    // Admin queue of NVME_ADMIN_QUEUE_SIZE entries on vector 0
    int create_admin_queue();
    // Allocates the shadow doorbell buffers for the admin queue and every
    // I/O queue the options ask for. Must precede create_io_queues().
    int enable_shadow_doorbells();
    // Queues 1..irq_count take interrupts on vector qid, the poll_count
    // queues after them are polled
    int create_io_queues(unsigned irq_count, unsigned poll_count);

    void add_namespace(const nvme_ns_t& ns);
    const nvme_ns_t* get_namespace(u32 nsid) const;

    // Queues a block request on hardware context hctx. On ENOMEM and
    // EAGAIN nothing was submitted and the caller may retry; EINVAL for
    // an unknown namespace or context is returned without calling end_io.
    // For any other error end_io has already been called with it.
    int make_request(unsigned hctx, blk::req_op op, u64 offset, u32 len,
                     std::vector<blk::bio_vec> segments, io_end_io end_io,
                     u32 nsid = 1, bool is_last = true);
    // Sends cmd as is on the admin queue; its command id is replaced by
    // the tag of the request carrying it
    int submit_passthrough(const nvme_sq_entry_t& cmd, bool to_device, admin_end_io end_io);

    // Rings the doorbell for submissions made with is_last unset
    void commit(unsigned hctx);
    // Reaps a polled context, returns the number of completions
    int poll(unsigned hctx);

    // Stops interrupt delivery for queue qid and reaps what the device
    // already posted
    int quiesce(u16 qid);
    // Quiesces every queue and releases them. Idempotent.
    void shutdown();

    std::shared_ptr<admin_queue> get_admin_queue() const { return _admin_queue; }
    std::shared_ptr<io_queue> get_io_queue(u16 qid) const;
    unsigned io_queue_count() const { return _io_queues.size(); }
    admin_tag_set* admin_tags() const { return _admin_tags.get(); }
    io_tag_set* io_tags() const { return _io_tags.get(); }

    const blk::cpu_queue_mapper& queue_map() const { return _queue_map; }
    unsigned hctx_for_cpu(unsigned cpu, bool polled) const;
private:
    void destroy_io_queues();

    //maintains the nvme instance number for multiple adapters
    static int _instance;
    int _id;

    pci::device& _dev;
    std::shared_ptr<device_data> _data;

    std::shared_ptr<admin_tag_set> _admin_tags;
    std::shared_ptr<admin_queue> _admin_queue;
    blk::cpu_queue_mapper _admin_map;
    nvme_ns_t _admin_ns;

    std::shared_ptr<io_tag_set> _io_tags;
    std::vector<std::shared_ptr<io_queue>> _io_queues;
    blk::cpu_queue_mapper _queue_map;

    std::map<u32, nvme_ns_t> _ns_data;
};

}
#endif
