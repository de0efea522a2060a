// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_FUTIL_XACT_H
#define __SRC_FUTIL_XACT_H

#include "futil.h"

namespace futil
{
    struct xact
    {
        inline void commit() {committed = true;}

    protected:
        bool committed;

        constexpr xact():committed(false) {}
    };

    // Creates the directory path and any missing ancestors.  If the
    // transaction is not committed, the directories that were created are
    // removed again, deepest first.  Fails with ENOTDIR if some component
    // already exists as something other than a directory.
    struct xact_mkdir_all : public xact
    {
        std::vector<futil::path> created;

        xact_mkdir_all(const path& p, mode_t mode)
        {
            try
            {
                std::vector<std::string> built;
                for (auto& c : p.decompose())
                {
                    built.push_back(c);
                    if (c == "/" || c == "." || c == "..")
                        continue;

                    auto sub = path::compose(built);
                    if (futil::mkdirat_if_not_exists(AT_FDCWD,sub,mode))
                    {
                        created.push_back(sub);
                        continue;
                    }

                    struct stat st;
                    futil::fstatat(AT_FDCWD,sub,&st,0);
                    if (!S_ISDIR(st.st_mode))
                        throw futil::errno_exception(ENOTDIR);
                }
            }
            catch (const futil::errno_exception&)
            {
                rollback();
                throw;
            }
        }

        ~xact_mkdir_all()
        {
            if (!committed)
                rollback();
        }

    private:
        void rollback()
        {
            while (!created.empty())
            {
                try
                {
                    futil::unlinkat(AT_FDCWD,created.back(),AT_REMOVEDIR);
                }
                catch (const futil::errno_exception&)
                {
                    // Someone else populated the directory; leave it.
                }
                created.pop_back();
            }
        }
    };

    struct _xact_mktemp : public xact
    {
        const int at_fd;
        char name[16];

    protected:
        int mk_fd;

        _xact_mktemp(int at_fd, mode_t mode):
            at_fd(at_fd)
        {
            for (;;)
            {
                uint32_t v = rand();
                snprintf(name,sizeof(name),".%08X.tmp",v);
                try
                {
                    mk_fd = futil::openat(at_fd,name,
                                          O_RDWR | O_CREAT | O_EXCL,mode);
                    return;
                }
                catch (const futil::errno_exception& e)
                {
                    if (e.errnov != EEXIST)
                        throw;
                }
            }
        }

        ~_xact_mktemp()
        {
            if (committed)
                return;
            try
            {
                futil::unlinkat_if_exists(at_fd,name,0);
            }
            catch (const futil::errno_exception&)
            {
            }
        }
    };

    struct xact_mktemp : public _xact_mktemp,
                         public file
    {
        // Creates a randomly-named file in dir.  The file is unlinked again
        // unless the transaction is committed, typically after renaming it
        // over its final destination.
        xact_mktemp(const directory& dir, mode_t mode):
            _xact_mktemp(dir.fd,mode),
            file(mk_fd)
        {
        }
    };
}

#endif /* __SRC_FUTIL_XACT_H */
