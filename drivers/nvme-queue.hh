/*
 * Copyright (C) 2023 Jan Braunwarth
 * Copyright (C) 2024 Waldemar Kozaczuk
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVME_QUEUE_H
#define NVME_QUEUE_H

#include <atomic>
#include <memory>

#include <nvmecore/interrupt.hh>
#include <nvmecore/spinlock.hh>

#include "drivers/blk-mq.hh"
#include "drivers/nvme-device.hh"
#include "drivers/nvme-structs.h"

#define NVME_CTRL_PAGE_SIZE  4096
#define NVME_CTRL_PAGE_SHIFT 12

// Offset of the SQ 0 tail doorbell in the register window
#define NVME_DOORBELL_BASE   0x1000

namespace nvme {

// Pair of submission queue and completion queue - SQ and CQ - as
// described in the chapter 4.1 of the NVMe specification. They work in
// tandem and share the same size.
//
// The SQ tail, owned by the submitters, is the 0-based index of the next
// free slot. After placing a new entry it is incremented and rolls to 0
// past the end. It only reaches the device when the doorbell is rung;
// _last_sq_tail remembers the value last announced, so several
// submissions can share one doorbell write.
//
// The CQ head, owned by the single context draining completions (the
// interrupt handler, or the poller for polled queues), is the index of
// the next entry to look at. An entry is new if its phase bit matches
// _cq_phase, which starts at 1 and flips on every wraparound of the head.
// Nothing serializes two drains of the same queue; callers must not
// drain one queue from two contexts at a time.
//
// The Ops type selects the request type the completions are matched to,
// see admin_queue_ops and io_queue_ops.
template <typename Ops>
class queue_pair
{
public:
    using tag_set_type = blk::tag_set<Ops>;

    // Returns nullptr if the rings cannot be allocated
    static std::shared_ptr<queue_pair> create(
        std::shared_ptr<device_data> data,
        u16 qid,
        u16 depth,
        u16 vector,
        std::shared_ptr<tag_set_type> tagset,
        bool polled
    );

    ~queue_pair();

    queue_pair(const queue_pair&) = delete;
    queue_pair& operator=(const queue_pair&) = delete;

    u64 sq_phys_addr() const { return _sq_dma; }
    u64 cq_phys_addr() const { return _cq_dma; }

    u16 qid() const { return _qid; }
    u16 depth() const { return _q_depth; }
    u16 cq_vector() const { return _cq_vector; }
    bool polled() const { return _polled; }
    device_data& data() { return *_data; }
    const std::shared_ptr<tag_set_type>& tagset() const { return _tagset; }

    // Copies cmd into the next SQ slot. The doorbell is rung if is_last is
    // set or the number of deferred entries reached the coalescing limit.
    void submit_command(const nvme_sq_entry_t& cmd, bool is_last);
    // Announces deferred submissions; with write_sq unset only if the
    // coalescing limit was reached
    void write_sq_db(bool write_sq);

    // Reaps the completions posted by the device and completes their
    // requests. Returns the number of entries consumed.
    int process_completions();

    int register_irq(pci::device& dev);
    void unregister_irq();
    bool irq_registered();

    // Whether moving a doorbell from old_idx to new_idx crosses the event
    // index the controller asked to be notified at
    static bool dbbuf_need_event(u16 event_idx, u16 new_idx, u16 old_idx)
    {
        return u16(new_idx - event_idx - 1) < u16(new_idx - old_idx);
    }
    // Stores value in the shadow doorbell and tells whether the register
    // must be written as well
    bool dbbuf_update_and_check_event(u16 value, u32 extra_index);

    u16 sq_tail();
    u16 last_sq_tail();
    u16 cq_head() const { return _cq_head.load(std::memory_order_relaxed); }
    u16 cq_phase() const { return _cq_phase.load(std::memory_order_relaxed); }
    u32 sq_db_coalesce() const { return _sq_db_coalesce; }
    u64 sq_db_offset() const { return _db_offset; }
    u64 cq_db_offset() const { return _db_offset + _data->db_stride(); }
private:
    queue_pair(std::shared_ptr<device_data> data, u16 qid, u16 depth, u16 vector,
               std::shared_ptr<tag_set_type> tagset, bool polled);

    void write_sq_db_locked(bool write_sq);
    void write_doorbell(u64 offset, u16 value);
    unsigned hctx_idx() const { return _qid ? _qid - 1 : 0; }

    std::shared_ptr<device_data> _data;
    u64 _db_offset;
    u32 _sdb_index;
    u16 _qid;
    bool _polled;

    std::atomic<u16> _cq_head;
    std::atomic<u16> _cq_phase;

    // Submission Queue (SQ) - each entry is 64 bytes in size
    nvme_sq_entry_t* _sq;
    u64 _sq_dma;
    // Completion Queue (CQ) - each entry is 16 bytes in size
    nvme_cq_entry_t* _cq;
    u64 _cq_dma;

    u16 _q_depth;
    u16 _cq_vector;
    u32 _sq_db_coalesce;

    // Protects _sq_tail, _last_sq_tail and _irq
    nvmecore::irq_spinlock _lock;
    u16 _sq_tail;
    u16 _last_sq_tail;
    std::unique_ptr<nvmecore::interrupt_registration> _irq;

    std::shared_ptr<tag_set_type> _tagset;
};

}

#endif
