// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include "walk_dir.h"
#include "exception.h"
#include <algorithm>

brename::walk_dir::walk_dir(const futil::path& root,
    const walk_options& options):
        options(options)
{
    try
    {
        push(root,0);
    }
    catch (const futil::errno_exception& e)
    {
        throw io_exception("open",e.errnov,root);
    }
}

void
brename::walk_dir::push(const futil::path& dir, size_t depth)
{
    futil::directory d(dir);
    auto names = d.listall();
    std::sort(names.begin(),names.end());
    stack.push_back(frame{dir,depth,std::move(names),0});
}

bool
brename::walk_dir::wanted(const struct stat& st) const
{
    if (S_ISREG(st.st_mode))
        return options.include_files;
    if (S_ISDIR(st.st_mode))
        return options.include_dirs;
    if (S_ISLNK(st.st_mode))
        return options.include_symlinks;
    return false;
}

bool
brename::walk_dir::next(walk_entry& e)
{
    while (!stack.empty())
    {
        auto& f = stack.back();
        if (f.pos == f.names.size())
        {
            stack.pop_back();
            continue;
        }

        futil::path p = f.dir + futil::path(f.names[f.pos++]);
        size_t depth = f.depth + 1;

        struct stat st;
        try
        {
            st = futil::lstat(p);
        }
        catch (const futil::errno_exception& err)
        {
            if (options.skip_errors)
                continue;
            throw io_exception("stat",err.errnov,p);
        }

        if (S_ISDIR(st.st_mode) &&
            (options.max_depth == 0 || depth < options.max_depth))
        {
            try
            {
                push(p,depth);
            }
            catch (const futil::errno_exception& err)
            {
                if (!options.skip_errors)
                    throw io_exception("open",err.errnov,p);
            }
        }

        if (wanted(st))
        {
            e = walk_entry{p,depth,st};
            return true;
        }
    }
    return false;
}
