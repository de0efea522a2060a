// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_LIBBRENAME_WALK_DIR_H
#define __SRC_LIBBRENAME_WALK_DIR_H

#include "config.h"
#include <futil/futil.h>
#include <vector>

namespace brename
{
    struct walk_options
    {
        // 0 walks the whole tree, 1 yields only the root's children.
        size_t  max_depth;
        bool    include_files;
        bool    include_dirs;
        bool    include_symlinks;
        bool    skip_errors;

        static walk_options from_config(const configuration& c)
        {
            return walk_options{c.max_depth,c.include_files,c.include_dirs,
                                c.include_symlinks,false};
        }
    };

    struct walk_entry
    {
        futil::path path;
        size_t      depth;
        struct stat st;

        bool is_file() const    {return S_ISREG(st.st_mode);}
        bool is_dir() const     {return S_ISDIR(st.st_mode);}
        bool is_symlink() const {return S_ISLNK(st.st_mode);}
    };

    // Lazily walks a directory tree in pre-order, with the entries of each
    // directory in sorted order.  Symlinks are never followed.  Directories
    // within max_depth are descended into whether or not they are yielded.
    //
    //      brename::walk_dir w("/some/dir",options);
    //      brename::walk_entry e;
    //      while (w.next(e))
    //          ...
    struct walk_dir
    {
        struct frame
        {
            futil::path                 dir;
            size_t                      depth;
            std::vector<std::string>    names;
            size_t                      pos;
        };

        const walk_options  options;
        std::vector<frame>  stack;

        // Fetches the next entry, returning false at the end of the walk.
        bool next(walk_entry& e);

        walk_dir(const futil::path& root, const walk_options& options);

    protected:
        bool wanted(const struct stat& st) const;
        void push(const futil::path& dir, size_t depth);
    };
}

#endif /* __SRC_LIBBRENAME_WALK_DIR_H */
