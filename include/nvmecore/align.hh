/*
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVMECORE_ALIGN_HH
#define NVMECORE_ALIGN_HH

// alignment must be a power of two
template <typename T>
inline constexpr T align_down(T n, T alignment)
{
    return n & ~(alignment - 1);
}

template <typename T>
inline constexpr T align_up(T n, T alignment)
{
    return align_down(n + alignment - 1, alignment);
}

#endif /* NVMECORE_ALIGN_HH */
