/*
 * Copyright (C) 2023 Jan Braunwarth
 * Copyright (C) 2024 Waldemar Kozaczuk
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include <algorithm>
#include <cerrno>
#include <thread>

#include <nvmecore/trace.hh>

#include "drivers/nvme-debug.hh"
#include "drivers/nvme.hh"

TRACEPOINT(trace_nvme_queue_create, "nvme%d qid=%d depth=%d vector=%d polled=%d", int, int, int, int, int);
TRACEPOINT(trace_nvme_quiesce, "nvme%d qid=%d reaped=%d", int, int, int);

namespace nvme {

int driver::_instance = 0;

static unsigned nr_cpus()
{
    return std::max(1u, std::thread::hardware_concurrency());
}

driver::driver(pci::device& dev, std::shared_ptr<pci::bar> bar,
               std::shared_ptr<dma::dma_device> dma, u32 doorbell_stride,
               const driver_options& opts)
    : _id(_instance++)
    , _dev(dev)
    , _data(std::make_shared<device_data>(_id, std::move(bar), std::move(dma),
                                          doorbell_stride, opts))
    , _admin_map(nr_cpus())
    , _admin_ns{0, 0, 0}
    , _queue_map(nr_cpus())
{
    nvme_i("nvme%d: doorbell stride %u, I/O queue depth %u\n", _id, doorbell_stride,
           opts.io_queue_depth);
}

driver::~driver()
{
    shutdown();
}

int driver::create_admin_queue()
{
    if (_admin_queue) {
        return EBUSY;
    }

    // one entry stays free so the SQ never looks empty when full
    auto tags = std::make_shared<admin_tag_set>(_data, 1, NVME_ADMIN_QUEUE_SIZE - 1);
    auto q = admin_queue::create(_data, 0, NVME_ADMIN_QUEUE_SIZE, 0, tags, false);
    if (!q) {
        return ENOMEM;
    }
    int ret = q->register_irq(_dev);
    if (ret) {
        return ret;
    }
    trace_nvme_queue_create(_id, 0, NVME_ADMIN_QUEUE_SIZE, 0, 0);

    _data->set_admin_queue(q);
    ret = tags->init_hctxs();
    if (ret) {
        q->unregister_irq();
        _data->clear_queues();
        return ret;
    }
    tags->map_queues(_admin_map);
    _admin_tags = std::move(tags);
    _admin_queue = std::move(q);
    return 0;
}

int driver::enable_shadow_doorbells()
{
    auto& opts = _data->options();
    return _data->alloc_shadow_doorbells(1 + opts.io_queues + opts.poll_queues);
}

int driver::create_io_queues(unsigned irq_count, unsigned poll_count)
{
    if (_io_tags) {
        return EBUSY;
    }
    unsigned nr_queues = irq_count + poll_count;
    if (nr_queues == 0 || nr_queues >= 0xffff) {
        return EINVAL;
    }
    if (irq_count && irq_count >= _dev.msix_vectors()) {
        NVME_ERROR("nvme%d: %u interrupt driven queues need more than %u vectors\n",
                   _id, irq_count, _dev.msix_vectors());
        return EINVAL;
    }

    auto& opts = _data->options();
    if (opts.shadow_doorbells && !_data->shadow()) {
        int ret = _data->alloc_shadow_doorbells(1 + nr_queues);
        if (ret) {
            return ret;
        }
    }
    if (auto shadow = _data->shadow()) {
        // the CQ head slot of the last queue must be covered
        u64 needed = (u64(nr_queues) * 2 + 2) * _data->db_stride() / sizeof(u32);
        if (needed > shadow->entries) {
            NVME_ERROR("nvme%d: shadow doorbells cover fewer than %u queues\n", _id, nr_queues);
            return EINVAL;
        }
    }

    u16 depth = opts.io_queue_depth;
    _data->set_queue_counts(irq_count, poll_count);
    _io_tags = std::make_shared<io_tag_set>(_data, nr_queues, depth - 1);

    for (unsigned qid = 1; qid <= nr_queues; qid++) {
        bool polled = qid > irq_count;
        u16 vector = polled ? 0 : qid;
        auto q = io_queue::create(_data, qid, depth, vector, _io_tags, polled);
        if (!q) {
            destroy_io_queues();
            return ENOMEM;
        }
        if (!polled) {
            int ret = q->register_irq(_dev);
            if (ret) {
                destroy_io_queues();
                return ret;
            }
        }
        trace_nvme_queue_create(_id, qid, depth, vector, polled);
        _data->add_io_queue(q);
        _io_queues.push_back(std::move(q));
    }

    int ret = _io_tags->init_hctxs();
    if (ret) {
        destroy_io_queues();
        return ret;
    }
    _io_tags->map_queues(_queue_map);

    nvme_i("nvme%d: %u I/O queues, %u of them polled\n", _id, nr_queues, poll_count);
    return 0;
}

void driver::destroy_io_queues()
{
    if (_io_tags) {
        unsigned busy = 0;
        for (unsigned i = 0; i < _io_tags->nr_hw_queues(); i++) {
            busy += _io_tags->busy_tags(i);
        }
        if (busy) {
            nvme_w("nvme%d: releasing I/O queues with %u requests outstanding\n", _id, busy);
        }
        _io_tags->exit_hctxs();
    }
    for (auto& q : _io_queues) {
        q->unregister_irq();
    }
    _data->clear_io_queues();
    _io_queues.clear();
    _io_tags.reset();
    _data->set_queue_counts(0, 0);
}

void driver::add_namespace(const nvme_ns_t& ns)
{
    _ns_data[ns.id] = ns;
}

const nvme_ns_t* driver::get_namespace(u32 nsid) const
{
    auto it = _ns_data.find(nsid);
    return it == _ns_data.end() ? nullptr : &it->second;
}

int driver::make_request(unsigned hctx, blk::req_op op, u64 offset, u32 len,
                         std::vector<blk::bio_vec> segments, io_end_io end_io,
                         u32 nsid, bool is_last)
{
    auto it = _ns_data.find(nsid);
    if (it == _ns_data.end() || !_io_tags || hctx >= _io_tags->nr_hw_queues()) {
        return EINVAL;
    }

    auto rq = _io_tags->alloc_request(hctx, op, offset, len, std::move(segments),
                                      std::move(end_io));
    if (!rq) {
        return EAGAIN;
    }
    int ret = _io_tags->dispatch(*rq, it->second, is_last);
    if (ret == ENOMEM || ret == EAGAIN) {
        _io_tags->free_request(*rq);
    }
    return ret;
}

int driver::submit_passthrough(const nvme_sq_entry_t& cmd, bool to_device, admin_end_io end_io)
{
    if (!_admin_tags) {
        return EINVAL;
    }
    auto op = to_device ? blk::req_op::drv_out : blk::req_op::drv_in;
    auto rq = _admin_tags->alloc_request(0, op, 0, 0, {}, std::move(end_io));
    if (!rq) {
        return EAGAIN;
    }
    rq->data().cmd = cmd;
    return _admin_tags->dispatch(*rq, _admin_ns, true);
}

void driver::commit(unsigned hctx)
{
    if (_io_tags && hctx < _io_tags->nr_hw_queues()) {
        _io_tags->commit(hctx);
    }
}

int driver::poll(unsigned hctx)
{
    if (!_io_tags || hctx >= _io_tags->nr_hw_queues()) {
        return 0;
    }
    return _io_tags->poll(hctx);
}

std::shared_ptr<io_queue> driver::get_io_queue(u16 qid) const
{
    if (qid == 0 || qid > _io_queues.size()) {
        return nullptr;
    }
    return _io_queues[qid - 1];
}

int driver::quiesce(u16 qid)
{
    int reaped;
    if (qid == 0) {
        if (!_admin_queue) {
            return EINVAL;
        }
        _admin_queue->unregister_irq();
        reaped = _admin_queue->process_completions();
    } else {
        auto q = get_io_queue(qid);
        if (!q) {
            return EINVAL;
        }
        q->unregister_irq();
        reaped = q->process_completions();
    }
    trace_nvme_quiesce(_id, qid, reaped);
    return 0;
}

void driver::shutdown()
{
    if (!_admin_queue && _io_queues.empty()) {
        return;
    }
    for (unsigned qid = 1; qid <= _io_queues.size(); qid++) {
        quiesce(qid);
    }
    destroy_io_queues();

    if (_admin_queue) {
        quiesce(0);
        _admin_tags->exit_hctxs();
        _admin_queue.reset();
        _admin_tags.reset();
    }
    _data->clear_queues();
    _data->free_shadow_doorbells();
    nvme_i("nvme%d: queues released\n", _id);
}

unsigned driver::hctx_for_cpu(unsigned cpu, bool polled) const
{
    return _queue_map.hctx_for(polled ? blk::hctx_type::poll : blk::hctx_type::default_type, cpu);
}

}
