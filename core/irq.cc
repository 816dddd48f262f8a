/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include <nvmecore/counters.hh>

namespace nvmecore {

namespace arch {
thread_local counters irq_counters;
}

}
