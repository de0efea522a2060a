// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_HDR_KASSERT_H
#define __SRC_HDR_KASSERT_H

#include <hdr/compiler.h>
#include <stdint.h>

// Internal invariant checks only; input errors are reported with exceptions.
void kabort(const char* f = __builtin_FILE(),
            unsigned int l = __builtin_LINE()) noexcept __NORETURN__;

inline void kassert(bool expr,
                     const char* f = __builtin_FILE(),
                     unsigned int l = __builtin_LINE())
{
    if (!expr)
        kabort(f,l);
}

#endif /* __SRC_HDR_KASSERT_H */
