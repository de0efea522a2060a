// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include "debug.h"
#include <stdio.h>

int
brename::debug_log::debugf(const char* fmt, ...) const
{
    va_list ap;
    va_start(ap,fmt);
    int rv = vdebugf(fmt,ap);
    va_end(ap);

    return rv;
}

int
brename::debug_log::vdebugf(const char* fmt, va_list ap) const
{
    if (!debug_enabled)
        return 0;

    return vprintf(fmt,ap);
}
