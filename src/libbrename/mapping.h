// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_LIBBRENAME_MAPPING_H
#define __SRC_LIBBRENAME_MAPPING_H

#include <futil/futil.h>

namespace brename
{
    // A single intended rename of src to dst.
    struct mapping
    {
        futil::path src;
        futil::path dst;

        mapping invert() const
        {
            return mapping{dst,src};
        }

        bool is_noop() const
        {
            return src._path == dst._path;
        }

        bool operator==(const mapping& other) const
        {
            return src._path == other.src._path &&
                   dst._path == other.dst._path;
        }
        bool operator!=(const mapping& other) const
        {
            return !(*this == other);
        }
    };

    static inline std::string to_string(const mapping& m)
    {
        return m.src._path + " -> " + m.dst._path;
    }
}

#endif /* __SRC_LIBBRENAME_MAPPING_H */
