/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include "drivers/blk-mq.hh"

namespace blk {

const char* req_op_name(req_op op)
{
    switch (op) {
    case req_op::read:          return "read";
    case req_op::write:         return "write";
    case req_op::flush:         return "flush";
    case req_op::discard:       return "discard";
    case req_op::write_zeroes:  return "write_zeroes";
    case req_op::drv_in:        return "drv_in";
    case req_op::drv_out:       return "drv_out";
    }
    return "unknown";
}

cpu_queue_mapper::cpu_queue_mapper(unsigned nr_cpus)
    : _nr_cpus(nr_cpus)
{
    assert(nr_cpus > 0);
}

void cpu_queue_mapper::assign(hctx_type type, unsigned nr_queues,
                              unsigned queue_offset, int irq_offset)
{
    auto& m = _maps[static_cast<unsigned>(type)];
    m.nr_queues = nr_queues;
    m.queue_offset = queue_offset;
    m.irq_offset = irq_offset;
    m.mq_map.assign(_nr_cpus, queue_offset);
    if (nr_queues == 0) {
        return;
    }
    for (unsigned cpu = 0; cpu < _nr_cpus; cpu++) {
        unsigned q;
        if (irq_offset >= 0) {
            // vectors are spread over contiguous groups of CPUs
            q = static_cast<u64>(cpu) * nr_queues / _nr_cpus;
        } else {
            q = cpu % nr_queues;
        }
        m.mq_map[cpu] = queue_offset + q;
    }
}

const cpu_queue_mapper::queue_map& cpu_queue_mapper::map(hctx_type type) const
{
    return _maps[static_cast<unsigned>(type)];
}

unsigned cpu_queue_mapper::hctx_for(hctx_type type, unsigned cpu) const
{
    auto* m = &map(type);
    if (m->nr_queues == 0) {
        m = &map(hctx_type::default_type);
    }
    if (m->mq_map.empty()) {
        return 0;
    }
    return m->mq_map[cpu % _nr_cpus];
}

int cpu_queue_mapper::vector_for(hctx_type type, unsigned cpu) const
{
    auto* m = &map(type);
    if (m->nr_queues == 0) {
        m = &map(hctx_type::default_type);
    }
    if (m->nr_queues == 0 || m->irq_offset < 0) {
        return -1;
    }
    return m->irq_offset + (m->mq_map[cpu % _nr_cpus] - m->queue_offset);
}

}
