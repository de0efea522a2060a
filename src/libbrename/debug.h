// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_LIBBRENAME_DEBUG_H
#define __SRC_LIBBRENAME_DEBUG_H

#include <hdr/compiler.h>
#include <stdarg.h>

namespace brename
{
    struct debug_log
    {
        // Whether or not to enable debug printfs.
        bool debug_enabled;

        // Prints a debug message.
        int debugf(const char* fmt, ...) const __PRINTF__(2,3);
        int vdebugf(const char* fmt, va_list ap) const;

        constexpr debug_log(bool debug_enabled = false):
            debug_enabled(debug_enabled)
        {
        }
    };
}

#endif /* __SRC_LIBBRENAME_DEBUG_H */
