/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVME_OPTIONS_H
#define NVME_OPTIONS_H

#include <string>
#include <vector>

#include <nvmecore/debug.hh>

#define NVME_ADMIN_QUEUE_SIZE 8

/*Will be lower if the device doesnt support the
specified queue size */
#define NVME_IO_QUEUE_SIZE 256

#define NVME_MIN_QUEUE_SIZE 2
#define NVME_MAX_QUEUE_SIZE 4096

namespace nvme {

struct driver_options {
    unsigned io_queue_depth = NVME_IO_QUEUE_SIZE;
    // interrupt driven I/O queues
    unsigned io_queues = 1;
    // polled I/O queues, placed after the interrupt driven ones
    unsigned poll_queues = 0;
    bool shadow_doorbells = false;
    // Deferred submissions after which the SQ doorbell is rung anyway.
    // 0 means depth - 1, the most the ring can hold.
    unsigned sq_db_coalesce = 0;
    nvmecore::logger_severity log_level = nvmecore::logger_info;
    // tracepoint name globs to enable
    std::vector<std::string> trace;
};

// Parses loader style arguments ("--nvme.io_queue_depth=64 ...").
// Arguments belonging to other subsystems are ignored. Returns EINVAL
// on malformed values, leaving opts partially updated.
int parse_options(const std::vector<std::string>& args, driver_options& opts);
int parse_options(const std::string& cmdline, driver_options& opts);

// Applies the process wide parts: log level and tracepoints
void apply_options(const driver_options& opts);

unsigned clamp_queue_depth(unsigned depth);
unsigned sq_db_coalesce_limit(const driver_options& opts, unsigned depth);

}

#endif
