/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#define BOOST_TEST_MODULE tst-nvme-queue

#include <boost/test/unit_test.hpp>

#include <cstring>

#include <nvmecore/counters.hh>
#include <nvmecore/spinlock.hh>
#include <nvmecore/trace.hh>

#include "tests/nvme-sim.hh"

using io_controller = sim::controller_queue<nvme::io_queue>;

static nvme_sq_entry_t blank_command()
{
    nvme_sq_entry_t cmd;
    memset(&cmd, 0, sizeof(cmd));
    return cmd;
}

// cid of the command most recently placed on q
static u16 last_cid(nvme::io_queue& q, io_controller& dev)
{
    u16 slot = (q.sq_tail() + q.depth() - 1) % q.depth();
    return dev.sq_entry(slot).common.cid;
}

BOOST_AUTO_TEST_CASE(test_queues_created)
{
    sim::controller c(sim::controller::options(8), 1, 1);
    BOOST_REQUIRE_EQUAL(c.io_ret, 0);
    BOOST_REQUIRE_EQUAL(c.drv.io_queue_count(), 2u);

    auto q1 = c.drv.get_io_queue(1);
    auto q2 = c.drv.get_io_queue(2);
    BOOST_REQUIRE(q1 && q2);
    BOOST_CHECK_EQUAL(q1->depth(), 8);
    BOOST_CHECK(!q1->polled());
    BOOST_CHECK(q2->polled());
    BOOST_CHECK_EQUAL(q1->cq_vector(), 1);
    BOOST_CHECK_EQUAL(q2->cq_vector(), 0);
    BOOST_CHECK_EQUAL(q1->sq_db_offset(), 0x1008u);
    BOOST_CHECK_EQUAL(q1->cq_db_offset(), 0x100cu);
    BOOST_CHECK_EQUAL(q2->sq_db_offset(), 0x1010u);
    BOOST_CHECK_EQUAL(q1->cq_phase(), 1);
    BOOST_CHECK_EQUAL(q1->cq_head(), 0);

    BOOST_CHECK(c.pci.registered(0));
    BOOST_CHECK(c.pci.registered(1));
    BOOST_CHECK(!c.pci.registered(2));
    BOOST_CHECK_EQUAL(c.pci.name_of(1), "nvme" + std::to_string(c.drv.instance()) + "q1");

    // the device queue table only refers to the queues
    BOOST_CHECK(c.drv.data()->get_io_queue(0) == q1);
    BOOST_CHECK_EQUAL(c.drv.data()->nr_io_queues(), 2u);
}

BOOST_AUTO_TEST_CASE(test_tail_wraps_modulo_depth)
{
    sim::controller c(sim::controller::options(8));
    auto q = c.drv.get_io_queue(2);
    auto db = sim::controller::sq_doorbell(2);
    auto cmd = blank_command();

    for (unsigned n = 1; n <= 20; n++) {
        q->submit_command(cmd, true);
        BOOST_REQUIRE_EQUAL(q->sq_tail(), n % 8);
        BOOST_REQUIRE_EQUAL(c.bar->count(db), n);
        BOOST_REQUIRE_EQUAL(c.bar->value(db), n % 8);
    }
}

BOOST_AUTO_TEST_CASE(test_doorbell_announces_every_submission)
{
    sim::controller c(sim::controller::options(8));
    auto q = c.drv.get_io_queue(2);
    auto db = sim::controller::sq_doorbell(2);
    auto cmd = blank_command();

    for (int i = 0; i < 3; i++) {
        q->submit_command(cmd, false);
    }
    BOOST_CHECK_EQUAL(c.bar->count(db), 0u);
    q->submit_command(cmd, true);
    BOOST_CHECK_EQUAL(c.bar->count(db), 1u);
    BOOST_CHECK_EQUAL(c.bar->value(db), 4u);
    BOOST_CHECK_EQUAL(q->last_sq_tail(), 4);

    q->submit_command(cmd, false);
    q->submit_command(cmd, false);
    q->submit_command(cmd, true);
    BOOST_CHECK_EQUAL(c.bar->count(db), 2u);
    BOOST_CHECK_EQUAL(c.bar->value(db), 7u);
}

BOOST_AUTO_TEST_CASE(test_default_coalescing_limit)
{
    sim::controller c(sim::controller::options(8));
    auto q = c.drv.get_io_queue(2);
    auto db = sim::controller::sq_doorbell(2);
    auto cmd = blank_command();

    BOOST_CHECK_EQUAL(q->sq_db_coalesce(), 7u);
    for (int i = 0; i < 6; i++) {
        q->submit_command(cmd, false);
    }
    BOOST_CHECK_EQUAL(c.bar->count(db), 0u);
    q->submit_command(cmd, false);
    BOOST_CHECK_EQUAL(c.bar->count(db), 1u);
    BOOST_CHECK_EQUAL(c.bar->value(db), 7u);
}

BOOST_AUTO_TEST_CASE(test_configured_coalescing_limit)
{
    auto opts = sim::controller::options(8);
    opts.sq_db_coalesce = 3;
    sim::controller c(opts);
    auto q = c.drv.get_io_queue(2);
    auto db = sim::controller::sq_doorbell(2);
    sim::data_buffer buf(4096);
    sim::completions done;

    BOOST_CHECK_EQUAL(q->sq_db_coalesce(), 3u);
    for (int i = 0; i < 4; i++) {
        BOOST_REQUIRE_EQUAL(sim::read_blocks(c, 1, i, buf, done, 1, false), 0);
    }
    BOOST_CHECK_EQUAL(c.bar->count(db), 1u);
    BOOST_CHECK_EQUAL(c.bar->value(db), 3u);

    // commit announces the one left behind, and only once
    c.drv.commit(1);
    BOOST_CHECK_EQUAL(c.bar->count(db), 2u);
    BOOST_CHECK_EQUAL(c.bar->value(db), 4u);
    c.drv.commit(1);
    BOOST_CHECK_EQUAL(c.bar->count(db), 2u);
}

BOOST_AUTO_TEST_CASE(test_drain_without_entries)
{
    sim::controller c(sim::controller::options(8));
    auto q = c.drv.get_io_queue(2);

    BOOST_CHECK_EQUAL(q->process_completions(), 0);
    BOOST_CHECK_EQUAL(q->process_completions(), 0);
    BOOST_CHECK_EQUAL(q->cq_head(), 0);
    BOOST_CHECK_EQUAL(q->cq_phase(), 1);
    BOOST_CHECK_EQUAL(c.bar->count(sim::controller::cq_doorbell(2)), 0u);
}

BOOST_AUTO_TEST_CASE(test_phase_bit_gates_completion)
{
    sim::controller c(sim::controller::options(8));
    auto q = c.drv.get_io_queue(2);
    io_controller dev(*q);
    sim::data_buffer buf(4096);
    sim::completions done;

    BOOST_REQUIRE_EQUAL(sim::read_blocks(c, 1, 7, buf, done), 0);
    u16 cid = last_cid(*q, dev);

    dev.post(cid, 0, 0, false);
    BOOST_CHECK_EQUAL(c.drv.poll(1), 0);
    BOOST_CHECK_EQUAL(q->cq_head(), 0);
    BOOST_CHECK_EQUAL(done.count(), 0u);

    dev.publish();
    BOOST_CHECK_EQUAL(c.drv.poll(1), 1);
    BOOST_CHECK_EQUAL(q->cq_head(), 1);
    BOOST_CHECK_EQUAL(c.drv.poll(1), 0);
    BOOST_REQUIRE_EQUAL(done.count(), 1u);
    BOOST_CHECK_EQUAL(done.last_error(), 0);

    BOOST_CHECK_EQUAL(c.bar->count(sim::controller::cq_doorbell(2)), 1u);
    BOOST_CHECK_EQUAL(c.bar->value(sim::controller::cq_doorbell(2)), 1u);
}

BOOST_AUTO_TEST_CASE(test_phase_flips_once_per_wrap)
{
    sim::controller c(sim::controller::options(8));
    auto q = c.drv.get_io_queue(2);
    io_controller dev(*q);
    sim::data_buffer buf(4096);
    sim::completions done;

    // the tag set holds depth - 1 requests, so wrap in two rounds
    for (unsigned round : {5, 3}) {
        std::vector<u16> cids;
        for (unsigned i = 0; i < round; i++) {
            BOOST_REQUIRE_EQUAL(sim::read_blocks(c, 1, i, buf, done), 0);
            cids.push_back(last_cid(*q, dev));
        }
        for (auto cid : cids) {
            dev.post(cid);
        }
        BOOST_REQUIRE_EQUAL(c.drv.poll(1), int(round));
    }
    BOOST_CHECK_EQUAL(q->cq_head(), 0);
    BOOST_CHECK_EQUAL(q->cq_phase(), 0);
    BOOST_CHECK_EQUAL(done.count(), 8u);

    // entries of the second lap carry phase 0
    BOOST_REQUIRE_EQUAL(sim::read_blocks(c, 1, 0, buf, done), 0);
    dev.post(last_cid(*q, dev));
    BOOST_CHECK_EQUAL(c.drv.poll(1), 1);
    BOOST_CHECK_EQUAL(q->cq_head(), 1);
    BOOST_CHECK_EQUAL(q->cq_phase(), 0);
    BOOST_CHECK_EQUAL(done.count(), 9u);
    for (auto e : done.errors) {
        BOOST_CHECK_EQUAL(e, 0);
    }
}

BOOST_AUTO_TEST_CASE(test_stale_completion_is_skipped)
{
    sim::controller c(sim::controller::options(8));
    auto q = c.drv.get_io_queue(2);
    io_controller dev(*q);
    sim::data_buffer buf(4096);
    sim::completions done;
    sim::log_capture log;

    // no request owns tag 3, nor any tag beyond the depth
    dev.post(3);
    dev.post(100);
    BOOST_CHECK_EQUAL(c.drv.poll(1), 2);
    BOOST_CHECK_EQUAL(q->cq_head(), 2);
    BOOST_CHECK(log.contains("invalid id completed: 3"));
    BOOST_CHECK(log.contains("invalid id completed: 100"));
    BOOST_CHECK_EQUAL(done.count(), 0u);

    BOOST_REQUIRE_EQUAL(sim::read_blocks(c, 1, 1, buf, done), 0);
    dev.post(last_cid(*q, dev));
    BOOST_CHECK_EQUAL(c.drv.poll(1), 1);
    BOOST_CHECK_EQUAL(done.count(), 1u);
}

BOOST_AUTO_TEST_CASE(test_need_event)
{
    auto need_event = &nvme::io_queue::dbbuf_need_event;

    // nothing moved
    BOOST_CHECK(!need_event(0, 5, 5));
    BOOST_CHECK(!need_event(5, 5, 5));
    // crossing the event index by one
    BOOST_CHECK(need_event(4, 5, 4));
    BOOST_CHECK(need_event(10, 11, 5));
    // stopping right at the event index
    BOOST_CHECK(!need_event(10, 10, 5));
    // event index already behind the old value
    BOOST_CHECK(!need_event(2, 6, 5));
    // wraparound of the 16-bit space
    BOOST_CHECK(need_event(0xfffe, 1, 0xfffd));
    BOOST_CHECK(need_event(0xffff, 0, 0xfffe));
    BOOST_CHECK(!need_event(2, 1, 0xfffd));
}

BOOST_AUTO_TEST_CASE(test_no_shadow_always_rings)
{
    sim::controller c(sim::controller::options(8));
    auto q = c.drv.get_io_queue(1);
    BOOST_CHECK(c.drv.data()->shadow() == nullptr);
    BOOST_CHECK(q->dbbuf_update_and_check_event(1, 0));
    BOOST_CHECK(q->dbbuf_update_and_check_event(1, 0));
}

BOOST_AUTO_TEST_CASE(test_shadow_doorbell_skips_register)
{
    auto opts = sim::controller::options(8);
    opts.shadow_doorbells = true;
    sim::controller c(opts);
    BOOST_REQUIRE_EQUAL(c.io_ret, 0);
    auto shadow = c.drv.data()->shadow();
    BOOST_REQUIRE(shadow);

    auto q = c.drv.get_io_queue(1);
    auto db = sim::controller::sq_doorbell(1);
    auto cmd = blank_command();
    // SQ tail of qid 1 sits at slot 2, its CQ head at slot 3
    const unsigned sq_slot = 2;

    q->submit_command(cmd, true);
    BOOST_CHECK_EQUAL(c.bar->count(db), 1u);
    BOOST_CHECK_EQUAL(u32(shadow->dbs[sq_slot]), 1u);

    q->submit_command(cmd, true);
    BOOST_CHECK_EQUAL(c.bar->count(db), 1u);
    BOOST_CHECK_EQUAL(u32(shadow->dbs[sq_slot]), 2u);

    shadow->eis[sq_slot] = 2;
    q->submit_command(cmd, true);
    BOOST_CHECK_EQUAL(c.bar->count(db), 2u);
    BOOST_CHECK_EQUAL(c.bar->value(db), 3u);
    BOOST_CHECK_EQUAL(u32(shadow->dbs[sq_slot]), 3u);
}

BOOST_AUTO_TEST_CASE(test_shadow_completion_doorbell)
{
    auto opts = sim::controller::options(8);
    opts.shadow_doorbells = true;
    sim::controller c(opts);
    auto q = c.drv.get_io_queue(2);
    io_controller dev(*q);
    auto shadow = c.drv.data()->shadow();
    auto cq_db = sim::controller::cq_doorbell(2);
    const unsigned cq_slot = 5;
    sim::data_buffer buf(4096);
    sim::completions done;

    for (int i = 0; i < 2; i++) {
        BOOST_REQUIRE_EQUAL(sim::read_blocks(c, 1, i, buf, done), 0);
        dev.post(last_cid(*q, dev));
        BOOST_REQUIRE_EQUAL(c.drv.poll(1), 1);
    }
    // the event index stayed at 0: only the first head update crossed it
    BOOST_CHECK_EQUAL(c.bar->count(cq_db), 1u);
    BOOST_CHECK_EQUAL(u32(shadow->dbs[cq_slot]), 2u);
    BOOST_CHECK_EQUAL(done.count(), 2u);
}

BOOST_AUTO_TEST_CASE(test_admin_queue_ignores_shadow)
{
    auto opts = sim::controller::options(8);
    opts.shadow_doorbells = true;
    sim::controller c(opts);
    auto shadow = c.drv.data()->shadow();
    auto cmd = blank_command();

    for (int i = 0; i < 2; i++) {
        BOOST_REQUIRE_EQUAL(c.drv.submit_passthrough(cmd, false, nullptr), 0);
    }
    BOOST_CHECK_EQUAL(c.bar->count(sim::controller::sq_doorbell(0)), 2u);
    BOOST_CHECK_EQUAL(u32(shadow->dbs[0]), 0u);
}

BOOST_AUTO_TEST_CASE(test_interrupt_reaps_completions)
{
    sim::controller c(sim::controller::options(8));
    auto q = c.drv.get_io_queue(1);
    io_controller dev(*q);
    sim::data_buffer buf(4096);
    bool in_handler = false;
    int error = -1;

    int ret = c.drv.make_request(0, blk::req_op::read, 0, 512,
                                 {blk::bio_vec{buf.page(), 0, 512}},
                                 [&] (nvme::io_queue_ops::request& rq, int e) {
                                     in_handler = nvmecore::arch::in_irq_handler();
                                     error = e;
                                 });
    BOOST_REQUIRE_EQUAL(ret, 0);

    BOOST_CHECK(!c.pci.fire(1));
    dev.post(last_cid(*q, dev));
    BOOST_CHECK(c.pci.fire(1));
    BOOST_CHECK_EQUAL(error, 0);
    BOOST_CHECK(in_handler);
    BOOST_CHECK(!nvmecore::arch::in_irq_handler());
    BOOST_CHECK(!c.pci.fire(1));
}

BOOST_AUTO_TEST_CASE(test_quiesce_detaches_and_drains)
{
    sim::controller c(sim::controller::options(8));
    auto q = c.drv.get_io_queue(1);
    io_controller dev(*q);
    sim::data_buffer buf(4096);
    sim::completions done;

    BOOST_REQUIRE_EQUAL(sim::read_blocks(c, 0, 3, buf, done), 0);
    dev.post(last_cid(*q, dev));

    BOOST_CHECK_EQUAL(c.drv.quiesce(1), 0);
    BOOST_CHECK(!q->irq_registered());
    BOOST_CHECK(!c.pci.registered(1));
    BOOST_CHECK_EQUAL(done.count(), 1u);
    BOOST_CHECK_EQUAL(q->cq_head(), 1);

    BOOST_CHECK_EQUAL(c.drv.quiesce(9), EINVAL);
}

BOOST_AUTO_TEST_CASE(test_irq_registration_errors)
{
    sim::controller c(sim::controller::options(8), 0, 0);
    BOOST_CHECK_EQUAL(c.drv.io_queue_count(), 0u);

    c.pci.refuse(1);
    BOOST_CHECK_EQUAL(c.drv.create_io_queues(1, 0), EBUSY);
    BOOST_CHECK_EQUAL(c.drv.io_queue_count(), 0u);
    BOOST_CHECK_EQUAL(c.drv.data()->nr_io_queues(), 0u);

    // polled queues never ask for a vector
    BOOST_REQUIRE_EQUAL(c.drv.create_io_queues(0, 1), 0);
    auto q = c.drv.get_io_queue(1);
    BOOST_CHECK(q->polled());
    BOOST_CHECK_EQUAL(q->register_irq(c.pci), EINVAL);
}

BOOST_AUTO_TEST_CASE(test_queue_creation_limits)
{
    sim::controller c(sim::controller::options(8), 0, 0, 2);
    BOOST_CHECK_EQUAL(c.drv.create_io_queues(0, 0), EINVAL);
    BOOST_CHECK_EQUAL(c.drv.create_io_queues(2, 0), EINVAL);

    c.dma->coherent_budget = 0;
    BOOST_CHECK_EQUAL(c.drv.create_io_queues(1, 0), ENOMEM);
    BOOST_CHECK(!c.pci.registered(1));

    c.dma->coherent_budget = -1;
    BOOST_CHECK_EQUAL(c.drv.create_io_queues(1, 0), 0);
    BOOST_CHECK_EQUAL(c.drv.create_io_queues(1, 0), EBUSY);
}

BOOST_AUTO_TEST_CASE(test_doorbell_tracepoint)
{
    sim::controller c(sim::controller::options(8));
    auto q = c.drv.get_io_queue(2);
    auto tp = nvmecore::find_tracepoint("trace_nvme_sq_doorbell");
    BOOST_REQUIRE(tp);

    BOOST_CHECK(nvmecore::enable_tracepoints("trace_nvme_sq_*") >= 1);
    auto before = tp->hits();
    q->submit_command(blank_command(), true);
    BOOST_CHECK_EQUAL(tp->hits(), before + 1);

    nvmecore::enable_tracepoints("trace_nvme_sq_*", false);
    q->submit_command(blank_command(), true);
    BOOST_CHECK_EQUAL(tp->hits(), before + 1);
}

BOOST_AUTO_TEST_CASE(test_detached_device_gets_no_doorbells)
{
    sim::controller c(sim::controller::options(8));
    auto q = c.drv.get_io_queue(2);
    auto db = sim::controller::sq_doorbell(2);

    q->submit_command(blank_command(), true);
    BOOST_CHECK_EQUAL(c.bar->count(db), 1u);

    c.drv.data()->detach_resources();
    BOOST_CHECK(c.drv.data()->bar() == nullptr);
    q->submit_command(blank_command(), true);
    BOOST_CHECK_EQUAL(q->sq_tail(), 2);
    BOOST_CHECK_EQUAL(c.bar->count(db), 1u);
}

BOOST_AUTO_TEST_CASE(test_mmio_register_window)
{
    const u64 window = 0x2000;
    std::vector<u32> regs(window / sizeof(u32), 0);
    auto bar = std::make_shared<pci::mmio_bar>(regs.data(), window);
    sim::fake_pci_device pci;
    auto dma = std::make_shared<sim::counting_dma>();
    {
        nvme::driver drv(pci, bar, dma, 4, sim::controller::options(8));
        BOOST_REQUIRE_EQUAL(drv.create_admin_queue(), 0);
        BOOST_REQUIRE_EQUAL(drv.create_io_queues(1, 0), 0);

        drv.get_io_queue(1)->submit_command(blank_command(), true);
        BOOST_CHECK_EQUAL(regs[0x1008 / 4], 1u);
        BOOST_CHECK_EQUAL(bar->readl(0x1008), 1u);
        BOOST_CHECK_EQUAL(bar->size(), window);
    }
    BOOST_CHECK_EQUAL(dma->coherent_allocs.load(), dma->coherent_frees.load());
}

BOOST_AUTO_TEST_CASE(test_submission_lock_masks_interrupts)
{
    nvmecore::irq_spinlock lock;
    BOOST_CHECK(!nvmecore::arch::irqs_disabled());
    WITH_LOCK(lock) {
        BOOST_CHECK(nvmecore::arch::irqs_disabled());
    }
    BOOST_CHECK(!nvmecore::arch::irqs_disabled());
}
