/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVMECORE_MUTEX_HH
#define NVMECORE_MUTEX_HH

#include <mutex>
#include <type_traits>

#define NVMECORE_CONCAT_(a, b) a##b
#define NVMECORE_CONCAT(a, b) NVMECORE_CONCAT_(a, b)

// Holds `lock` until the end of the enclosing scope
#define SCOPE_LOCK(lock) \
    std::lock_guard<typename std::remove_reference<decltype(lock)>::type> \
        NVMECORE_CONCAT(_scope_lock_, __LINE__)(lock)

// WITH_LOCK(lock) { ... } runs the block with `lock` held
#define WITH_LOCK(lock) \
    for (std::unique_lock<typename std::remove_reference<decltype(lock)>::type> \
            _with_lock_guard(lock); _with_lock_guard.owns_lock(); \
            _with_lock_guard.unlock())

#endif /* NVMECORE_MUTEX_HH */
