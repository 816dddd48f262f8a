/*
 * Copyright (C) 2023 Jan Braunwarth
 * Copyright (C) 2024 Waldemar Kozaczuk
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include <cassert>
#include <cerrno>

#include <nvmecore/arch.hh>
#include <nvmecore/mutex.hh>
#include <nvmecore/printf.hh>
#include <nvmecore/trace.hh>

#include "drivers/nvme-debug.hh"
#include "drivers/nvme-mq.hh"
#include "drivers/nvme-queue.hh"

TRACEPOINT(trace_nvme_submit, "nvme%d qid=%d cid=%d opc=%#x tail=%d", int, int, int, int, int);
TRACEPOINT(trace_nvme_sq_doorbell, "nvme%d qid=%d tail=%d", int, int, int);
TRACEPOINT(trace_nvme_cq_doorbell, "nvme%d qid=%d head=%d", int, int, int);
TRACEPOINT(trace_nvme_doorbell_skipped, "nvme%d qid=%d value=%d old=%d event_idx=%d", int, int, int, int, int);
TRACEPOINT(trace_nvme_completion, "nvme%d qid=%d cid=%d status=%#x result=%#x", int, int, int, int, unsigned);
TRACEPOINT(trace_nvme_invalid_cid, "nvme%d qid=%d cid=%d", int, int, int);
TRACEPOINT(trace_nvme_irq_register, "nvme%d qid=%d vector=%d", int, int, int);
TRACEPOINT(trace_nvme_irq_unregister, "nvme%d qid=%d vector=%d", int, int, int);

namespace nvme {

template <typename Ops>
std::shared_ptr<queue_pair<Ops>> queue_pair<Ops>::create(
    std::shared_ptr<device_data> data,
    u16 qid,
    u16 depth,
    u16 vector,
    std::shared_ptr<tag_set_type> tagset,
    bool polled)
{
    assert(depth >= NVME_MIN_QUEUE_SIZE);
    std::shared_ptr<queue_pair> q(new queue_pair(std::move(data), qid, depth, vector,
                                                 std::move(tagset), polled));
    if (!q->_sq || !q->_cq) {
        NVME_ERROR("nvme%d: failed to allocate rings for queue %d\n",
                   q->_data->instance(), qid);
        return nullptr;
    }
    return q;
}

template <typename Ops>
queue_pair<Ops>::queue_pair(
    std::shared_ptr<device_data> data,
    u16 qid,
    u16 depth,
    u16 vector,
    std::shared_ptr<tag_set_type> tagset,
    bool polled)
      : _data(std::move(data))
      , _qid(qid)
      , _polled(polled)
      , _cq_head(0)
      , _cq_phase(1)
      , _sq(nullptr)
      , _sq_dma(0)
      , _cq(nullptr)
      , _cq_dma(0)
      , _q_depth(depth)
      , _cq_vector(vector)
      , _sq_tail(0)
      , _last_sq_tail(0)
      , _tagset(std::move(tagset))
{
    u64 sdb_offset = u64(qid) * _data->db_stride() * 2;
    _db_offset = NVME_DOORBELL_BASE + sdb_offset;
    _sdb_index = sdb_offset / sizeof(u32);
    _sq_db_coalesce = sq_db_coalesce_limit(_data->options(), depth);

    // alloc_coherent hands out zeroed memory, so no CQ entry carries
    // the initial phase before the device posts one
    auto& dma = _data->dma();
    _cq = static_cast<nvme_cq_entry_t*>(dma.alloc_coherent(depth * sizeof(nvme_cq_entry_t), &_cq_dma));
    _sq = static_cast<nvme_sq_entry_t*>(dma.alloc_coherent(depth * sizeof(nvme_sq_entry_t), &_sq_dma));
}

template <typename Ops>
queue_pair<Ops>::~queue_pair()
{
    unregister_irq();

    auto& dma = _data->dma();
    if (_sq) {
        dma.free_coherent(_q_depth * sizeof(nvme_sq_entry_t), _sq, _sq_dma);
    }
    if (_cq) {
        dma.free_coherent(_q_depth * sizeof(nvme_cq_entry_t), _cq, _cq_dma);
    }
}

template <typename Ops>
int queue_pair<Ops>::process_completions()
{
    u16 head = _cq_head.load(std::memory_order_relaxed);
    u16 phase = _cq_phase.load(std::memory_order_relaxed);
    int found = 0;

    while (true) {
        auto cqe = reinterpret_cast<volatile nvme_cq_entry_t*>(&_cq[head]);
        u16 status = cqe->psf;
        if ((status & 1) != phase) {
            break;
        }
        // the rest of the entry must not be read ahead of the phase bit
        std::atomic_thread_fence(std::memory_order_acquire);
        u16 cid = cqe->cid;
        u32 result = cqe->cs;

        found++;
        if (++head == _q_depth) {
            head = 0;
            phase ^= 1;
        }

        trace_nvme_completion(_data->instance(), _qid, cid, status >> 1, result);
        auto rq = _tagset->tag_to_rq(hctx_idx(), cid);
        if (rq) {
            auto& pdu = rq->data();
            pdu.result.store(result, std::memory_order_relaxed);
            pdu.status.store(status >> 1, std::memory_order_relaxed);
            rq->complete();
        } else {
            trace_nvme_invalid_cid(_data->instance(), _qid, cid);
            nvme_w("nvme%d qid=%d: invalid id completed: %d\n", _data->instance(), _qid, cid);
        }
    }

    if (found == 0) {
        return found;
    }

    if (dbbuf_update_and_check_event(head, _data->db_stride() / sizeof(u32))) {
        write_doorbell(cq_db_offset(), head);
        trace_nvme_cq_doorbell(_data->instance(), _qid, head);
    }

    _cq_head.store(head, std::memory_order_relaxed);
    _cq_phase.store(phase, std::memory_order_relaxed);

    return found;
}

template <typename Ops>
bool queue_pair<Ops>::dbbuf_update_and_check_event(u16 value, u32 extra_index)
{
    // the admin queue always rings the register
    if (_qid == 0) {
        return true;
    }

    auto shadow = _data->shadow();
    if (!shadow) {
        return true;
    }

    u32 index = _sdb_index + extra_index;
    assert(index < shadow->entries);

    // Ensure that the queue is written before updating the doorbell in
    // memory
    nvmecore::arch::wmb();

    u16 old_value = shadow->dbs[index];
    shadow->dbs[index] = value;

    // Ensure that the doorbell is updated before reading the event index
    // from memory. The controller orders its event index update before
    // reading the doorbell the same way.
    nvmecore::arch::mb();

    u16 event_idx = shadow->eis[index];
    if (!dbbuf_need_event(event_idx, value, old_value)) {
        trace_nvme_doorbell_skipped(_data->instance(), _qid, value, old_value, event_idx);
        return false;
    }
    return true;
}

template <typename Ops>
void queue_pair<Ops>::write_doorbell(u64 offset, u16 value)
{
    auto bar = _data->bar();
    if (!bar) {
        return;
    }
    nvmecore::arch::wmb();
    bar->writel(offset, value);
}

template <typename Ops>
void queue_pair<Ops>::write_sq_db(bool write_sq)
{
    SCOPE_LOCK(_lock);
    write_sq_db_locked(write_sq);
}

template <typename Ops>
void queue_pair<Ops>::write_sq_db_locked(bool write_sq)
{
    if (_sq_tail == _last_sq_tail) {
        return;
    }
    if (!write_sq) {
        u16 pending = (_sq_tail + _q_depth - _last_sq_tail) % _q_depth;
        if (pending < _sq_db_coalesce) {
            return;
        }
    }

    if (dbbuf_update_and_check_event(_sq_tail, 0)) {
        write_doorbell(_db_offset, _sq_tail);
        trace_nvme_sq_doorbell(_data->instance(), _qid, _sq_tail);
    }
    _last_sq_tail = _sq_tail;
}

template <typename Ops>
void queue_pair<Ops>::submit_command(const nvme_sq_entry_t& cmd, bool is_last)
{
    SCOPE_LOCK(_lock);
    trace_nvme_submit(_data->instance(), _qid, cmd.common.cid, cmd.common.opc, _sq_tail);
    _sq[_sq_tail] = cmd;
    if (++_sq_tail == _q_depth) {
        _sq_tail = 0;
    }
    write_sq_db_locked(is_last);
}

template <typename Ops>
int queue_pair<Ops>::register_irq(pci::device& dev)
{
    if (_polled) {
        NVME_ERROR("nvme%d: queue %d is polled and takes no interrupt\n", _data->instance(), _qid);
        return EINVAL;
    }

    nvme_i("Registering irq for queue qid: %d, vector %d\n", _qid, _cq_vector);
    // The registration is owned by this queue and is destroyed before it,
    // so the handler may refer to it directly
    auto irq = dev.request_irq(_cq_vector, [this] {
            nvmecore::arch::irq_handler_guard guard;
            return process_completions() ? nvmecore::irq_return::handled
                                         : nvmecore::irq_return::none;
        }, nvmecore::sprintf("nvme%dq%d", _data->instance(), _qid));
    if (!irq) {
        NVME_ERROR("nvme%d: failed to register vector %d for queue %d\n",
                   _data->instance(), _cq_vector, _qid);
        return EBUSY;
    }
    trace_nvme_irq_register(_data->instance(), _qid, _cq_vector);

    std::unique_ptr<nvmecore::interrupt_registration> old;
    WITH_LOCK(_lock) {
        old = std::move(_irq);
        _irq = std::move(irq);
    }
    return 0;
}

template <typename Ops>
void queue_pair<Ops>::unregister_irq()
{
    // Do not drop the registration while the spinlock is held, freeing
    // the vector may sleep
    std::unique_ptr<nvmecore::interrupt_registration> irq;
    WITH_LOCK(_lock) {
        irq = std::move(_irq);
    }
    if (irq) {
        trace_nvme_irq_unregister(_data->instance(), _qid, _cq_vector);
        irq.reset();
    }
}

template <typename Ops>
bool queue_pair<Ops>::irq_registered()
{
    SCOPE_LOCK(_lock);
    return _irq != nullptr;
}

template <typename Ops>
u16 queue_pair<Ops>::sq_tail()
{
    SCOPE_LOCK(_lock);
    return _sq_tail;
}

template <typename Ops>
u16 queue_pair<Ops>::last_sq_tail()
{
    SCOPE_LOCK(_lock);
    return _last_sq_tail;
}

template class queue_pair<admin_queue_ops>;
template class queue_pair<io_queue_ops>;

}
