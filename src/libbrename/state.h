// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_LIBBRENAME_STATE_H
#define __SRC_LIBBRENAME_STATE_H

#include "mapping.h"
#include <vector>

namespace brename
{
    // Snapshot of a rename queue: the entries already applied and the entries
    // still pending, both in queue order.
    struct persistable_state
    {
        std::vector<mapping>    renamed;
        std::vector<mapping>    pending;
    };

    // Renders the state as a YAML document:
    //
    //      renamed:
    //        - src: /abs/a
    //          dst: /abs/b
    //      pending:
    //        - src: /abs/b
    //          dst: /abs/c
    std::string to_yaml(const persistable_state& s);

    // Parses a YAML document produced by to_yaml().  Both top-level keys are
    // required, each record needs exactly src and dst, and anything else
    // throws invalid_state_file_exception.  The mappings are not
    // re-validated.
    persistable_state parse_state(const std::string& text);

    // Writes the state to a temporary file in the same directory, fsyncs it
    // and renames it over path so that a crash leaves either the old or the
    // new state behind.
    void save_state(const persistable_state& s, const futil::path& path);

    persistable_state load_state(const futil::path& path);
}

#endif /* __SRC_LIBBRENAME_STATE_H */
