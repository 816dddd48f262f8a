/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include <cerrno>
#include <cstring>

#include <nvmecore/trace.hh>

#include "drivers/nvme-debug.hh"
#include "drivers/nvme-mq.hh"

TRACEPOINT(trace_nvme_rw, "nvme%d qid=%d tag=%d %s slba=%lu nlb=%u", int, int, int, const char*, u64, unsigned);
TRACEPOINT(trace_nvme_flush, "nvme%d qid=%d tag=%d nsid=%u", int, int, int, unsigned);
TRACEPOINT(trace_nvme_passthrough, "nvme%d qid=%d tag=%d opc=%#x", int, int, int, int);
TRACEPOINT(trace_nvme_map_inline, "tag=%d dma=%#lx len=%u", int, u64, unsigned);
TRACEPOINT(trace_nvme_map_sg, "tag=%d nents=%u pages=%u", int, unsigned, unsigned);
TRACEPOINT(trace_nvme_rq_error, "nvme%d tag=%d status=%#x", int, int, int);

namespace nvme {

nvme_request::nvme_request(const std::shared_ptr<device_data>& data)
    : dma_addr(dma::mapping_error)
    , result(0)
    , status(0)
    , direction(dma::direction::from_device)
    , len(0)
    , sg_count(0)
    , page_count(0)
    , first_dma(0)
    , dev(data)
    , dma_pool(data->dma_pool())
    , _mapping(nullptr)
{
    memset(&cmd, 0, sizeof(cmd));
}

nvme_request::~nvme_request()
{
    delete _mapping.exchange(nullptr, std::memory_order_relaxed);
}

void nvme_request::set_mapping(std::unique_ptr<mapping_data> md)
{
    delete _mapping.exchange(md.release(), std::memory_order_relaxed);
}

std::unique_ptr<mapping_data> nvme_request::take_mapping()
{
    return std::unique_ptr<mapping_data>(_mapping.exchange(nullptr, std::memory_order_relaxed));
}

static bool is_passthrough(blk::req_op op)
{
    return op == blk::req_op::drv_in || op == blk::req_op::drv_out;
}

// Maps the payload and fills in the data pointers of pdu.cmd. The request
// is started only once the mapping is in place, so a failure leaves it
// untouched for a retry.
template <typename Ops>
static int map_data(queue_pair<Ops>& q, blk::request<Ops>& rq, dma::direction dir)
{
    auto& pdu = rq.data();
    auto& dev = q.data().dma();
    auto& cmd = pdu.cmd;
    u32 len = rq.payload_bytes();

    if (rq.nr_phys_segments() == 1) {
        auto& bv = rq.first_bvec();
        if ((bv.offset % NVME_CTRL_PAGE_SIZE) + len <= NVME_CTRL_PAGE_SIZE * 2) {
            u64 dma_addr = dev.map_page(bv.page, bv.offset, len, dir);
            if (dma_addr == dma::mapping_error) {
                return ENOMEM;
            }
            rq.start();

            cmd.common.prp1 = dma_addr;
            u32 first_prp_len = NVME_CTRL_PAGE_SIZE - (dma_addr & (NVME_CTRL_PAGE_SIZE - 1));
            if (len > first_prp_len) {
                cmd.common.prp2 = dma_addr + first_prp_len;
            }

            pdu.dma_addr.store(dma_addr, std::memory_order_relaxed);
            pdu.direction.store(dir, std::memory_order_relaxed);
            pdu.len.store(len, std::memory_order_relaxed);
            trace_nvme_map_inline(rq.tag(), dma_addr, len);
            return 0;
        }
    }

    std::unique_ptr<mapping_data> md(new mapping_data());
    unsigned nents = rq.map_sg(md->sg);
    unsigned count = dev.map_sg(md->sg.data(), nents, dir);
    if (!count) {
        return ENOMEM;
    }

    u32 page_count;
    int ret = setup_prps(*pdu.dma_pool, cmd, *md, count, len, page_count);
    if (ret) {
        dev.unmap_sg(md->sg.data(), count, dir);
        return ret;
    }

    pdu.dma_addr.store(dma::mapping_error, std::memory_order_relaxed);
    pdu.sg_count.store(count, std::memory_order_relaxed);
    pdu.page_count.store(page_count, std::memory_order_relaxed);
    pdu.first_dma.store(cmd.common.prp2, std::memory_order_relaxed);
    pdu.direction.store(dir, std::memory_order_relaxed);
    pdu.len.store(len, std::memory_order_relaxed);
    pdu.set_mapping(std::move(md));
    trace_nvme_map_sg(rq.tag(), count, page_count);

    rq.start();
    return 0;
}

static void unmap_data(nvme_request& pdu)
{
    auto& dev = pdu.dev->dma();
    auto dir = pdu.direction.load(std::memory_order_relaxed);

    auto md = pdu.take_mapping();
    if (md) {
        dev.unmap_sg(md->sg.data(), pdu.sg_count.load(std::memory_order_relaxed), dir);
        free_prps(pdu.page_count.load(std::memory_order_relaxed), md->pages,
                  pdu.first_dma.load(std::memory_order_relaxed), *pdu.dma_pool);
        return;
    }

    u64 dma_addr = pdu.dma_addr.exchange(dma::mapping_error, std::memory_order_relaxed);
    if (dma_addr != dma::mapping_error) {
        dev.unmap_page(dma_addr, pdu.len.load(std::memory_order_relaxed), dir);
    }
}

template <typename Ops>
static int queue_rq(queue_pair<Ops>& q, nvme_ns_t& ns, blk::request<Ops>& rq, bool is_last)
{
    auto& pdu = rq.data();
    auto& cmd = pdu.cmd;
    int instance = q.data().instance();

    switch (rq.command()) {
    case blk::req_op::drv_in:
    case blk::req_op::drv_out:
        cmd.common.cid = rq.tag();
        trace_nvme_passthrough(instance, q.qid(), rq.tag(), cmd.common.opc);
        rq.start();
        q.submit_command(cmd, is_last);
        return 0;

    case blk::req_op::flush:
        memset(&cmd, 0, sizeof(cmd));
        cmd.common.opc = NVME_CMD_FLUSH;
        cmd.common.nsid = ns.id;
        cmd.common.cid = rq.tag();
        trace_nvme_flush(instance, q.qid(), rq.tag(), ns.id);
        rq.start();
        q.submit_command(cmd, is_last);
        return 0;

    case blk::req_op::read:
    case blk::req_op::write: {
        bool read = rq.command() == blk::req_op::read;
        u32 len = rq.payload_bytes();
        u32 block_size = 1u << ns.blockshift;
        u64 nblocks = len >> ns.blockshift;
        if (len == 0 || len % block_size || rq.offset() % block_size || nblocks > 0x10000) {
            NVME_ERROR("nvme%d: misaligned %s of %u bytes at %lu\n", instance,
                       blk::req_op_name(rq.command()), len, rq.offset());
            return EINVAL;
        }

        memset(&cmd, 0, sizeof(cmd));
        cmd.rw.common.opc = read ? NVME_CMD_READ : NVME_CMD_WRITE;
        cmd.rw.common.cid = rq.tag();
        cmd.rw.common.nsid = ns.id;
        cmd.rw.slba = rq.offset() >> ns.blockshift;
        cmd.rw.nlb = nblocks - 1;

        int ret = map_data(q, rq, read ? dma::direction::from_device : dma::direction::to_device);
        if (ret) {
            return ret;
        }
        trace_nvme_rw(instance, q.qid(), rq.tag(), blk::req_op_name(rq.command()),
                      cmd.rw.slba, cmd.rw.nlb);
        q.submit_command(cmd, is_last);
        return 0;
    }

    default:
        nvme_w("nvme%d: unsupported operation %s\n", instance, blk::req_op_name(rq.command()));
        return EIO;
    }
}

template <typename Ops>
static void complete(blk::request<Ops>& rq)
{
    auto& pdu = rq.data();

    // Passthrough always ends successfully, the submitter inspects
    // pdu.status and pdu.result from its end_io
    if (is_passthrough(rq.command())) {
        rq.end_ok();
        return;
    }

    unmap_data(pdu);

    u16 status = pdu.status.load(std::memory_order_relaxed);
    if (status) {
        trace_nvme_rq_error(pdu.dev->instance(), rq.tag(), status);
        nvme_i("nvme%d: completing tag %d with error %#x\n", pdu.dev->instance(), rq.tag(), status);
        rq.end_err(EIO);
        return;
    }
    rq.end_ok();
}

nvme_request admin_queue_ops::new_request_data(const tagset_data& data)
{
    return nvme_request(data);
}

int admin_queue_ops::init_hctx(const tagset_data& data, unsigned hctx_idx, hw_data& hw)
{
    hw = data->get_admin_queue();
    return hw ? 0 : EINVAL;
}

int admin_queue_ops::queue_rq(const hw_data& q, nvme_ns_t& ns, request& rq, bool is_last)
{
    return nvme::queue_rq(*q, ns, rq, is_last);
}

void admin_queue_ops::complete(request& rq)
{
    nvme::complete(rq);
}

void admin_queue_ops::commit_rqs(const hw_data& q)
{
    q->write_sq_db(true);
}

int admin_queue_ops::map_queues(const tagset_data& data, blk::queue_mapper& mapper)
{
    mapper.assign(blk::hctx_type::default_type, 1, 0, -1);
    return 0;
}

nvme_request io_queue_ops::new_request_data(const tagset_data& data)
{
    return nvme_request(data);
}

int io_queue_ops::init_hctx(const tagset_data& data, unsigned hctx_idx, hw_data& hw)
{
    hw = data->get_io_queue(hctx_idx);
    return hw ? 0 : EINVAL;
}

int io_queue_ops::queue_rq(const hw_data& q, nvme_ns_t& ns, request& rq, bool is_last)
{
    return nvme::queue_rq(*q, ns, rq, is_last);
}

void io_queue_ops::complete(request& rq)
{
    nvme::complete(rq);
}

void io_queue_ops::commit_rqs(const hw_data& q)
{
    q->write_sq_db(true);
}

int io_queue_ops::poll(const hw_data& q)
{
    return q->process_completions();
}

// Interrupt driven queues come first and follow the affinity of the
// vectors after the admin one; polled queues come last and have none
int io_queue_ops::map_queues(const tagset_data& data, blk::queue_mapper& mapper)
{
    unsigned queue_offset = 0;
    int irq_offset = 1;
    for (unsigned i = 0; i < blk::hctx_max_types; i++) {
        auto type = static_cast<blk::hctx_type>(i);
        unsigned count = 0;
        switch (type) {
        case blk::hctx_type::default_type:
            count = data->irq_queue_count();
            break;
        case blk::hctx_type::poll:
            count = data->poll_queue_count();
            break;
        default:
            break;
        }
        if (count == 0) {
            mapper.assign(type, 0, 0, -1);
            continue;
        }
        mapper.assign(type, count, queue_offset,
                      type == blk::hctx_type::poll ? -1 : irq_offset);
        queue_offset += count;
        irq_offset += count;
    }
    return 0;
}

}
