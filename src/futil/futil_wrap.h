// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_FUTIL_FUTIL_WRAP_H
#define __SRC_FUTIL_FUTIL_WRAP_H

#include <hdr/compiler.h>
#include <fcntl.h>
#include <unistd.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/errno.h>
#include <dirent.h>
#include <string.h>
#include <exception>
#include <string>

namespace futil
{
    struct exception : public std::exception
    {
        exception() {}
    };

    struct errno_exception : public exception
    {
        int errnov;

        virtual const char* what() const noexcept override
        {
            return strerror(errnov);
        }

        errno_exception(int errnov):
            errnov(errnov)
        {
        }
    };

    // Exception thrown if passing inconsistent parameters to file constructor
    // (i.e. O_CREAT without a mode or a mode without O_CREAT).
    struct inconsistent_file_params : public exception
    {
        virtual const char* what() const noexcept override
        {
            return "Inconsistent arguments passed to file::file().";
        }

        inconsistent_file_params():
            exception()
        {
        }
    };

#ifdef UNITTEST

    void fsync(int fd);
    void close(int fd);
    int openat(int at_fd, const char* path, int oflag);
    int openat(int at_fd, const char* path, int oflag, mode_t mode);
    int openat_if_exists(int at_fd, const char* path, int oflag);
    DIR* fdopendir(int fd);
    struct dirent* readdir(DIR* dirp);
    void closedir(DIR* dirp);
    int open(const char* path, int oflag);
    ssize_t read(int fd, void* buf, size_t nbyte);
    ssize_t write(int fd, const void* buf, size_t nbyte);
    void mkdir(const char* path, mode_t mode);
    void mkdirat(int at_fd, const char* path, mode_t mode);
    bool mkdir_if_not_exists(const char* path, mode_t mode);
    bool mkdirat_if_not_exists(int at_fd, const char* path, mode_t mode);
    void symlink(const char* path1, const char* path2);
    void unlink(const char* path);
    void unlinkat(int at_fd, const char* path, int flag);
    void unlink_if_exists(const char* path);
    void unlinkat_if_exists(int at_fd, const char* path, int flag);
    void rename(const char* old, const char* _new);
    void renameat(int fromfd, const char* from, int tofd, const char* to);
    bool renameat_if_not_exists(int fromfd, const char* from, int tofd,
                                const char* to);
    void fstatat(int at_fd, const char* path, struct stat* st, int flag);
    bool fstatat_if_exists(int at_fd, const char* path, struct stat* st,
                           int flag);
    std::string getcwd();

#else

    inline void fsync(int fd)
    {
        for (;;)
        {
#if IS_MACOS
            if (::fsync(fd) != -1)
                return;
#elif IS_LINUX
            if (::fdatasync(fd) != -1)
                return;
#endif
            if (errno != EINTR)
                throw futil::errno_exception(errno);
        }
    }

    inline void close(int fd)
    {
        for (;;)
        {
            if (::close(fd) != -1)
                return;
            if (errno != EINTR)
                throw futil::errno_exception(errno);
        }
    }

    inline int openat(int at_fd, const char* path, int oflag)
    {
        if (oflag & O_CREAT)
            throw inconsistent_file_params();
        for (;;)
        {
            int fd = ::openat(at_fd,path,oflag);
            if (fd != -1)
                return fd;
            if (errno != EINTR)
                throw errno_exception(errno);
        }
    }

    inline int openat(int at_fd, const char* path, int oflag, mode_t mode)
    {
        if (!(oflag & O_CREAT))
            throw inconsistent_file_params();
        for (;;)
        {
            int fd = ::openat(at_fd,path,oflag,mode);
            if (fd != -1)
                return fd;
            if (errno != EINTR)
                throw errno_exception(errno);
        }
    }

    inline int openat_if_exists(int at_fd, const char* path, int oflag)
    {
        for (;;)
        {
            int fd = ::openat(at_fd,path,oflag);
            if (fd != -1 || errno == ENOENT)
                return fd;
            if (errno != EINTR)
                throw errno_exception(errno);
        }
    }

    inline DIR* fdopendir(int fd)
    {
        auto* dirp = ::fdopendir(fd);
        if (!dirp)
            throw errno_exception(EBADF);
        return dirp;
    }

    inline struct dirent* readdir(DIR* dirp)
    {
        return ::readdir(dirp);
    }

    inline void closedir(DIR* dirp)
    {
        if (::closedir(dirp) == -1)
            throw errno_exception(errno);
    }

    inline int open(const char* path, int oflag)
    {
        for (;;)
        {
            int fd = ::open(path,oflag);
            if (fd != -1)
                return fd;
            if (errno != EINTR)
                throw errno_exception(errno);
        }
    }

    inline ssize_t read(int fd, void* buf, size_t nbyte)
    {
        for (;;)
        {
            ssize_t v = ::read(fd,buf,nbyte);
            if (v != -1)
                return v;
            if (errno != EINTR)
                throw errno_exception(errno);
        }
    }

    inline ssize_t write(int fd, const void* buf, size_t nbyte)
    {
        for (;;)
        {
            ssize_t v = ::write(fd,buf,nbyte);
            if (v != -1)
                return v;
            if (errno != EINTR)
                throw errno_exception(errno);
        }
    }

    inline void mkdir(const char* path, mode_t mode)
    {
        // mkdir() doesn't seem to return EINTR.
        if (::mkdir(path,mode) == -1)
            throw errno_exception(errno);
    }

    inline void mkdirat(int at_fd, const char* path, mode_t mode)
    {
        // mkdirat() doesn't seem to return EINTR.
        if (::mkdirat(at_fd,path,mode) == -1)
            throw errno_exception(errno);
    }

    inline bool mkdir_if_not_exists(const char* path, mode_t mode)
    {
        // Returns true if the directory was created, false if something with
        // that name already existed.
        if (::mkdir(path,mode) != -1)
            return true;
        if (errno != EEXIST)
            throw errno_exception(errno);
        return false;
    }

    inline bool mkdirat_if_not_exists(int at_fd, const char* path, mode_t mode)
    {
        if (::mkdirat(at_fd,path,mode) != -1)
            return true;
        if (errno != EEXIST)
            throw errno_exception(errno);
        return false;
    }

    inline void symlink(const char* path1, const char* path2)
    {
        // symlink() doesn't seem to return EINTR.
        if (::symlink(path1,path2) == -1)
            throw errno_exception(errno);
    }

    inline void unlink(const char* path)
    {
        // unlink() doesn't seem to return EINTR.
        if (::unlink(path) == -1)
            throw errno_exception(errno);
    }

    inline void unlinkat(int at_fd, const char* path, int flag)
    {
        // unlinkat() doesn't seem to return EINTR.
        if (::unlinkat(at_fd,path,flag) == -1)
            throw errno_exception(errno);
    }

    inline void unlink_if_exists(const char* path)
    {
        if (::unlink(path) == -1 && errno != ENOENT)
            throw errno_exception(errno);
    }

    inline void unlinkat_if_exists(int at_fd, const char* path, int flag)
    {
        if (::unlinkat(at_fd,path,flag) == -1 && errno != ENOENT)
            throw errno_exception(errno);
    }

    inline void rename(const char* old, const char* _new)
    {
        // rename() doesn't seem to return EINTR.
        if (::rename(old,_new) == -1)
            throw errno_exception(errno);
    }

    inline void renameat(int fromfd, const char* from, int tofd, const char* to)
    {
        // renameat() doesn't seem to return EINTR.
        if (::renameat(fromfd,from,tofd,to) == -1)
            throw errno_exception(errno);
    }

    inline bool renameat_if_not_exists(int fromfd, const char* from, int tofd,
                                       const char* to)
    {
#if IS_MACOS
        if (!::renameatx_np(fromfd,from,tofd,to,RENAME_EXCL))
            return true;
#elif IS_LINUX
        if (!::renameat2(fromfd,from,tofd,to,RENAME_NOREPLACE))
            return true;
#else
#error Unknown platform.
#endif
        if (errno == EEXIST)
            return false;
        throw errno_exception(errno);
    }

    inline void fstatat(int at_fd, const char* path, struct stat* st, int flag)
    {
        if (::fstatat(at_fd,path,st,flag) == -1)
            throw errno_exception(errno);
    }

    inline bool fstatat_if_exists(int at_fd, const char* path, struct stat* st,
                                  int flag)
    {
        // Returns false if the path does not exist.  A dangling component in
        // the middle of the path (ENOTDIR) also counts as not existing.
        if (::fstatat(at_fd,path,st,flag) != -1)
            return true;
        if (errno == ENOENT || errno == ENOTDIR)
            return false;
        throw errno_exception(errno);
    }

    inline std::string getcwd()
    {
        std::string s(256,'\0');
        for (;;)
        {
            if (::getcwd(&s[0],s.size()) != NULL)
            {
                s.resize(strlen(s.c_str()));
                return s;
            }
            if (errno != ERANGE)
                throw errno_exception(errno);
            s.resize(s.size()*2);
        }
    }

#endif
}

#endif /* __SRC_FUTIL_FUTIL_WRAP_H */
