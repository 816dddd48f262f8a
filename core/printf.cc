/*
 * Copyright (C) 2013 Cloudius Systems, Ltd.
 * Copyright (C) 2026 The nvmecore Authors
 *
 * This work is open source software, licensed under the terms of the
 * BSD license as described in the LICENSE file in the top-level directory.
 */

#include <cstdio>
#include <vector>

#include <nvmecore/printf.hh>

namespace nvmecore {

std::string vsprintf(const char* fmt, va_list ap)
{
    va_list aq;
    va_copy(aq, ap);
    char buf[256];
    int n = vsnprintf(buf, sizeof(buf), fmt, aq);
    va_end(aq);
    if (n < 0) {
        return std::string();
    }
    if (static_cast<size_t>(n) < sizeof(buf)) {
        return std::string(buf, n);
    }
    std::vector<char> big(n + 1);
    vsnprintf(big.data(), big.size(), fmt, ap);
    return std::string(big.data(), n);
}

std::string sprintf(const char* fmt...)
{
    va_list ap;
    va_start(ap, fmt);
    auto ret = vsprintf(fmt, ap);
    va_end(ap);
    return ret;
}

}
