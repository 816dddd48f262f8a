/*
 * Copyright (C) 2013 Cloudius Systems, Ltd.
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#ifndef NVMECORE_PRINTF_HH
#define NVMECORE_PRINTF_HH

#include <cstdarg>
#include <string>

namespace nvmecore {

std::string sprintf(const char* fmt...) __attribute__((format(printf, 1, 2)));
std::string vsprintf(const char* fmt, va_list ap);

} // namespace nvmecore

#endif /* NVMECORE_PRINTF_HH */
