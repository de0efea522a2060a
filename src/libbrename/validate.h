// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_LIBBRENAME_VALIDATE_H
#define __SRC_LIBBRENAME_VALIDATE_H

#include "mapping.h"
#include <vector>

namespace brename
{
    // Normalizes every pair to absolute form and checks that the set is a
    // functional graph whose paths are all leaves:
    //
    //  - a source mapped to two different destinations throws
    //    one_to_many_exception,
    //  - a destination claimed by two different sources throws
    //    many_to_one_exception,
    //  - a path that is an ancestor of another path in the set throws
    //    non_leaf_node_exception,
    //  - an empty path throws empty_path_exception.
    //
    // Identical duplicate pairs are dropped.  Self-mappings are kept since
    // they still take part in the collision and ancestry checks.  The result
    // is in input order.
    std::vector<mapping> validate(const std::vector<mapping>& pairs);
}

#endif /* __SRC_LIBBRENAME_VALIDATE_H */
