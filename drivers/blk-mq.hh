/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef BLK_MQ_H
#define BLK_MQ_H

#include <atomic>
#include <cassert>
#include <cerrno>
#include <functional>
#include <memory>
#include <vector>

#include <nvmecore/types.h>
#include <nvmecore/mutex.hh>
#include <nvmecore/spinlock.hh>

#include "drivers/dma.hh"

// Host side of the block layer: per hardware context request slots, tag
// allocation and the hooks a driver implements. A driver describes itself
// with an Ops type providing:
//
//   request_data, queue_data, hw_data, tagset_data     types
//   has_poll                                           bool constant
//   new_request_data(tagset_data)  -> request_data
//   init_hctx(tagset_data, idx, hw_data&)  -> int
//   queue_rq(hw_data, queue_data&, request&, is_last)  -> int
//   complete(request&)
//   commit_rqs(hw_data)
//   poll(hw_data)  -> int                              (if has_poll)
//   map_queues(tagset_data, queue_mapper&)  -> int
namespace blk {

enum class req_op {
    read,
    write,
    flush,
    discard,
    write_zeroes,
    drv_in,
    drv_out,
};

const char* req_op_name(req_op op);

// One physically contiguous piece of a request's payload
struct bio_vec {
    u64 page;       // physical address of the page
    u32 offset;     // offset of the data within the page
    u32 len;
};

// True when b starts where a ends in physical memory
inline bool bvec_adjacent(const bio_vec& a, const bio_vec& b)
{
    return a.page + a.offset + a.len == b.page + b.offset;
}

template <typename Ops> class request;

// Called once when the request finishes, with 0 or an errno value. The
// request keeps its tag for the duration of the call.
template <typename Ops>
using end_io_fn = std::function<void (request<Ops>& rq, int error)>;

enum class hctx_type {
    default_type = 0,
    read = 1,
    poll = 2,
};
constexpr unsigned hctx_max_types = 3;

// The one operation a driver needs to shape how CPUs reach its hardware
// contexts: "contexts [queue_offset, queue_offset + nr_queues) serve
// traffic class type". With irq_offset >= 0 the contexts follow the CPU
// affinity of interrupt vectors irq_offset, irq_offset + 1, ...; with a
// negative irq_offset they are spread over the CPUs.
class queue_mapper {
public:
    virtual ~queue_mapper() {}
    virtual void assign(hctx_type type, unsigned nr_queues,
                        unsigned queue_offset, int irq_offset) = 0;
};

class cpu_queue_mapper : public queue_mapper {
public:
    struct queue_map {
        unsigned nr_queues = 0;
        unsigned queue_offset = 0;
        int irq_offset = -1;
        std::vector<unsigned> mq_map;   // cpu -> hardware context
    };

    explicit cpu_queue_mapper(unsigned nr_cpus);

    virtual void assign(hctx_type type, unsigned nr_queues,
                        unsigned queue_offset, int irq_offset) override;

    const queue_map& map(hctx_type type) const;
    // Classes without queues fall back to the default class
    unsigned hctx_for(hctx_type type, unsigned cpu) const;
    // Interrupt vector serving `cpu` in `type`, -1 if not irq affine
    int vector_for(hctx_type type, unsigned cpu) const;
    unsigned nr_cpus() const { return _nr_cpus; }
private:
    unsigned _nr_cpus;
    queue_map _maps[hctx_max_types];
};

template <typename Ops> class tag_set;

template <typename Ops>
class request {
public:
    using request_data = typename Ops::request_data;

    request(tag_set<Ops>& set, unsigned hctx_idx, u16 tag)
        : _set(set)
        , _hctx_idx(hctx_idx)
        , _tag(tag)
        , _pdu(Ops::new_request_data(set.data()))
    {
    }

    request(const request&) = delete;
    request& operator=(const request&) = delete;

    u16 tag() const { return _tag; }
    unsigned hctx_idx() const { return _hctx_idx; }
    req_op command() const { return _op; }
    // Byte offset on the device
    u64 offset() const { return _offset; }
    u32 payload_bytes() const { return _len; }
    // Physically contiguous runs of the payload, adjacent bio_vecs merged
    unsigned nr_phys_segments() const;
    const bio_vec& first_bvec() const { return _segments.front(); }
    const std::vector<bio_vec>& segments() const { return _segments; }

    // Builds the host scatter-gather list, merging segments that are
    // physically adjacent. Returns the number of entries.
    unsigned map_sg(std::vector<dma::scatterlist>& sg) const;

    request_data& data() { return _pdu; }

    // Marks the request as handed to hardware
    void start() { _started = true; }
    bool is_started() const { return _started; }
    bool in_flight() const { return _state.load(std::memory_order_acquire) == state::in_flight; }

    // Entry point for the completion path of the driver
    void complete() { Ops::complete(*this); }
    void end_ok() { end(0); }
    void end_err(int error) { end(error); }
private:
    friend class tag_set<Ops>;

    enum class state {
        idle,
        allocated,
        in_flight,
    };

    void prepare(req_op op, u64 offset, u32 len, std::vector<bio_vec>&& segments,
                 end_io_fn<Ops>&& end_io);
    void end(int error);

    tag_set<Ops>& _set;
    const unsigned _hctx_idx;
    const u16 _tag;
    std::atomic<state> _state = { state::idle };
    bool _started = false;
    req_op _op = req_op::read;
    u64 _offset = 0;
    u32 _len = 0;
    std::vector<bio_vec> _segments;
    end_io_fn<Ops> _end_io;
    request_data _pdu;
};

template <typename Ops>
class tag_set {
public:
    using hw_data = typename Ops::hw_data;
    using tagset_data = typename Ops::tagset_data;
    using queue_data = typename Ops::queue_data;

    tag_set(tagset_data data, unsigned nr_hw_queues, unsigned queue_depth);

    tag_set(const tag_set&) = delete;
    tag_set& operator=(const tag_set&) = delete;

    // Binds every hardware context to its hardware queue
    int init_hctxs();
    // Drops the hardware queue references taken by init_hctxs()
    void exit_hctxs();

    const tagset_data& data() const { return _data; }
    unsigned nr_hw_queues() const { return _hctxs.size(); }
    unsigned queue_depth() const { return _queue_depth; }
    const hw_data& hctx(unsigned idx) const { return _hctxs.at(idx)->hw; }

    // Takes a free tag of context hctx_idx and fills the request in.
    // Returns nullptr when all tags are in use.
    request<Ops>* alloc_request(unsigned hctx_idx, req_op op, u64 offset, u32 len,
                                std::vector<bio_vec> segments, end_io_fn<Ops> end_io);
    // Gives back a request that was allocated but never dispatched
    void free_request(request<Ops>& rq);

    // In-flight request owning `tag`, nullptr for unknown or stale tags
    request<Ops>* tag_to_rq(unsigned hctx_idx, u16 tag) const;
    unsigned busy_tags(unsigned hctx_idx) const;

    // Hands the request to the driver. ENOMEM and EAGAIN leave the
    // request allocated for a later retry; any other error ends it.
    int dispatch(request<Ops>& rq, queue_data& ns, bool is_last);
    void commit(unsigned hctx_idx);
    // Returns the number of completions reaped, 0 if the context has no
    // poll support
    int poll(unsigned hctx_idx);

    int map_queues(queue_mapper& mapper) { return Ops::map_queues(_data, mapper); }
private:
    friend class request<Ops>;

    struct hw_ctx {
        hw_data hw;
        mutable nvmecore::spinlock lock;
        std::vector<u16> free_tags;
        std::vector<std::unique_ptr<request<Ops>>> rqs;
    };

    void free_tag(unsigned hctx_idx, u16 tag);

    tagset_data _data;
    unsigned _queue_depth;
    std::vector<std::unique_ptr<hw_ctx>> _hctxs;
};

template <typename Ops>
unsigned request<Ops>::map_sg(std::vector<dma::scatterlist>& sg) const
{
    sg.clear();
    const bio_vec* prev = nullptr;
    for (auto& bv : _segments) {
        if (prev && bvec_adjacent(*prev, bv)) {
            sg.back().length += bv.len;
        } else {
            sg.push_back(dma::scatterlist{bv.page, bv.offset, bv.len, 0, 0});
        }
        prev = &bv;
    }
    return sg.size();
}

template <typename Ops>
unsigned request<Ops>::nr_phys_segments() const
{
    unsigned n = 0;
    const bio_vec* prev = nullptr;
    for (auto& bv : _segments) {
        if (!prev || !bvec_adjacent(*prev, bv)) {
            n++;
        }
        prev = &bv;
    }
    return n;
}

template <typename Ops>
void request<Ops>::prepare(req_op op, u64 offset, u32 len, std::vector<bio_vec>&& segments,
                           end_io_fn<Ops>&& end_io)
{
    _op = op;
    _offset = offset;
    _len = len;
    _segments = std::move(segments);
    _end_io = std::move(end_io);
    _started = false;
    _state.store(state::allocated, std::memory_order_relaxed);
}

template <typename Ops>
void request<Ops>::end(int error)
{
    auto end_io = std::move(_end_io);
    _end_io = nullptr;
    _state.store(state::idle, std::memory_order_release);
    if (end_io) {
        end_io(*this, error);
    }
    _started = false;
    _segments.clear();
    _set.free_tag(_hctx_idx, _tag);
}

template <typename Ops>
tag_set<Ops>::tag_set(tagset_data data, unsigned nr_hw_queues, unsigned queue_depth)
    : _data(std::move(data))
    , _queue_depth(queue_depth)
{
    assert(queue_depth > 0 && queue_depth <= 0x10000);
    for (unsigned i = 0; i < nr_hw_queues; i++) {
        std::unique_ptr<hw_ctx> ctx(new hw_ctx);
        ctx->rqs.reserve(queue_depth);
        ctx->free_tags.reserve(queue_depth);
        for (unsigned tag = 0; tag < queue_depth; tag++) {
            ctx->rqs.emplace_back(new request<Ops>(*this, i, tag));
            // lowest tags are handed out first
            ctx->free_tags.push_back(queue_depth - 1 - tag);
        }
        _hctxs.push_back(std::move(ctx));
    }
}

template <typename Ops>
int tag_set<Ops>::init_hctxs()
{
    for (unsigned i = 0; i < _hctxs.size(); i++) {
        int ret = Ops::init_hctx(_data, i, _hctxs[i]->hw);
        if (ret) {
            exit_hctxs();
            return ret;
        }
    }
    return 0;
}

template <typename Ops>
void tag_set<Ops>::exit_hctxs()
{
    for (auto& ctx : _hctxs) {
        ctx->hw = hw_data();
    }
}

template <typename Ops>
request<Ops>* tag_set<Ops>::alloc_request(unsigned hctx_idx, req_op op, u64 offset, u32 len,
                                          std::vector<bio_vec> segments, end_io_fn<Ops> end_io)
{
    auto& ctx = *_hctxs.at(hctx_idx);
    u16 tag;
    WITH_LOCK(ctx.lock) {
        if (ctx.free_tags.empty()) {
            return nullptr;
        }
        tag = ctx.free_tags.back();
        ctx.free_tags.pop_back();
    }
    auto rq = ctx.rqs[tag].get();
    rq->prepare(op, offset, len, std::move(segments), std::move(end_io));
    return rq;
}

template <typename Ops>
void tag_set<Ops>::free_request(request<Ops>& rq)
{
    assert(rq._state.load(std::memory_order_relaxed) == request<Ops>::state::allocated);
    rq._end_io = nullptr;
    rq._segments.clear();
    rq._state.store(request<Ops>::state::idle, std::memory_order_release);
    free_tag(rq.hctx_idx(), rq.tag());
}

template <typename Ops>
void tag_set<Ops>::free_tag(unsigned hctx_idx, u16 tag)
{
    auto& ctx = *_hctxs[hctx_idx];
    SCOPE_LOCK(ctx.lock);
    ctx.free_tags.push_back(tag);
}

template <typename Ops>
request<Ops>* tag_set<Ops>::tag_to_rq(unsigned hctx_idx, u16 tag) const
{
    if (hctx_idx >= _hctxs.size() || tag >= _queue_depth) {
        return nullptr;
    }
    auto rq = _hctxs[hctx_idx]->rqs[tag].get();
    return rq->in_flight() ? rq : nullptr;
}

template <typename Ops>
unsigned tag_set<Ops>::busy_tags(unsigned hctx_idx) const
{
    auto& ctx = *_hctxs.at(hctx_idx);
    SCOPE_LOCK(ctx.lock);
    return _queue_depth - ctx.free_tags.size();
}

template <typename Ops>
int tag_set<Ops>::dispatch(request<Ops>& rq, queue_data& ns, bool is_last)
{
    auto& hw = _hctxs.at(rq.hctx_idx())->hw;
    if (!hw) {
        rq.end_err(EIO);
        return EIO;
    }
    // Published before queue_rq: the device may complete the command
    // before queue_rq returns
    rq._state.store(request<Ops>::state::in_flight, std::memory_order_release);
    int ret = Ops::queue_rq(hw, ns, rq, is_last);
    if (ret == 0) {
        return 0;
    }
    if (ret == ENOMEM || ret == EAGAIN) {
        rq._state.store(request<Ops>::state::allocated, std::memory_order_release);
        return ret;
    }
    rq.end_err(ret);
    return ret;
}

template <typename Ops>
void tag_set<Ops>::commit(unsigned hctx_idx)
{
    auto& hw = _hctxs.at(hctx_idx)->hw;
    if (hw) {
        Ops::commit_rqs(hw);
    }
}

template <typename Ops>
int tag_set<Ops>::poll(unsigned hctx_idx)
{
    if constexpr (Ops::has_poll) {
        auto& hw = _hctxs.at(hctx_idx)->hw;
        return hw ? Ops::poll(hw) : 0;
    } else {
        return 0;
    }
}

}

#endif
