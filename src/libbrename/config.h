// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_LIBBRENAME_CONFIG_H
#define __SRC_LIBBRENAME_CONFIG_H

#include <futil/futil.h>
#include <string>

namespace brename
{
    // Configuration as loaded from the config file.
    struct configuration
    {
        bool        require_file_or_symlink;
        bool        create_parent_dirs;
        bool        checkpoint;
        size_t      max_depth;
        bool        include_files;
        bool        include_dirs;
        bool        include_symlinks;
        bool        debug;
    };
    std::string to_string(const configuration& c);

    extern const configuration default_configuration;

    // Loads a "key value" configuration file.  Keys that do not appear keep
    // their default values.
    configuration load_configuration(const futil::path& path);
}

#endif /* __SRC_LIBBRENAME_CONFIG_H */
