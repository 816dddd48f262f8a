/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVME_DEVICE_H
#define NVME_DEVICE_H

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

#include "drivers/dma.hh"
#include "drivers/nvme-options.hh"
#include "drivers/pci-device.hh"

namespace nvme {

template <typename Ops> class queue_pair;
struct admin_queue_ops;
struct io_queue_ops;

using admin_queue = queue_pair<admin_queue_ops>;
using io_queue = queue_pair<io_queue_ops>;

// Shadow doorbell buffers (Doorbell Buffer Config). The controller reads
// our doorbell values from dbs and publishes in eis the value after which
// it wants a real register write.
struct dbbuf {
    volatile u32* dbs;
    u64 dbs_dma;
    volatile u32* eis;
    u64 eis_dma;
    size_t size;        // bytes of each buffer
    size_t entries;     // u32 slots of each buffer
};

// State shared by all queues of one controller. It outlives every queue:
// queues hold a counted reference to it, the queue table here only holds
// weak ones.
class device_data {
public:
    device_data(int instance, std::shared_ptr<pci::bar> bar,
                std::shared_ptr<dma::dma_device> dma, u32 db_stride,
                const driver_options& opts);
    ~device_data();

    device_data(const device_data&) = delete;
    device_data& operator=(const device_data&) = delete;

    int instance() const { return _instance; }

    // Register window, nullptr once the device is gone
    pci::bar* bar() const { return _bar.load(std::memory_order_acquire); }
    void detach_resources();

    dma::dma_device& dma() { return *_dma; }
    const std::shared_ptr<dma::dma_pool>& dma_pool() const { return _dma_pool; }

    // Distance in bytes between two doorbell registers
    u32 db_stride() const { return _db_stride; }
    const driver_options& options() const { return _opts; }

    // Must be set up before the I/O queues are created and torn down
    // after they are gone
    int alloc_shadow_doorbells(unsigned nr_queues);
    void free_shadow_doorbells();
    dbbuf* shadow() const { return _shadow.get(); }

    void set_admin_queue(const std::shared_ptr<admin_queue>& q);
    std::shared_ptr<admin_queue> get_admin_queue();
    void add_io_queue(const std::shared_ptr<io_queue>& q);
    std::shared_ptr<io_queue> get_io_queue(unsigned idx);
    unsigned nr_io_queues();
    void clear_io_queues();
    void clear_queues();

    void set_queue_counts(unsigned irq_queues, unsigned poll_queues);
    unsigned irq_queue_count() const { return _irq_queue_count; }
    unsigned poll_queue_count() const { return _poll_queue_count; }
private:
    struct queue_table {
        std::weak_ptr<admin_queue> admin;
        std::vector<std::weak_ptr<io_queue>> io;
    };

    int _instance;
    std::shared_ptr<pci::bar> _bar_owner;
    std::atomic<pci::bar*> _bar;
    std::shared_ptr<dma::dma_device> _dma;
    std::shared_ptr<dma::dma_pool> _dma_pool;
    u32 _db_stride;
    driver_options _opts;
    std::unique_ptr<dbbuf> _shadow;

    std::mutex _queues_lock;
    queue_table _queues;

    unsigned _irq_queue_count = 0;
    unsigned _poll_queue_count = 0;
};

}

#endif
