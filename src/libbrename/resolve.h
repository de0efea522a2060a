// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_LIBBRENAME_RESOLVE_H
#define __SRC_LIBBRENAME_RESOLVE_H

#include "mapping.h"
#include "debug.h"
#include <vector>

namespace brename
{
    // Orders a validated mapping set into a sequence of primitive renames
    // that can be executed one after the other without overwriting anything.
    //
    // Chains are emitted destination-first, so a->b->c->d becomes
    // [c->d, b->c, a->b].  A cycle is broken by moving the node that closes
    // it to a temporary path first, so the swap a<->b becomes
    // [b->b.temp_0, a->b, b.temp_0->a].  Temporary paths replace the
    // extension of the closing node with temp_N, choosing the first N that
    // neither exists on disk nor appears anywhere in the set.
    //
    // Self-mappings produce no entries.
    std::vector<mapping> resolve(const std::vector<mapping>& validated,
                                 const debug_log& log = debug_log());
}

#endif /* __SRC_LIBBRENAME_RESOLVE_H */
