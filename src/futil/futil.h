// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_FUTIL_FUTIL_H
#define __SRC_FUTIL_FUTIL_H

#include "futil_wrap.h"
#include <hdr/kassert.h>
#include <algorithm>
#include <string>
#include <vector>

namespace futil
{
    // Exception thrown when two paths cannot be joined.  This could be the
    // case if the second path is an absolute path, for instance.
    struct invalid_join_exception : public futil::exception
    {
        virtual const char* what() const noexcept override
        {
            return "Cannot join paths.";
        }

        invalid_join_exception():
            exception()
        {
        }
    };

    struct path
    {
        std::string _path;

        size_t size() const {return _path.size();}
        bool empty() const  {return _path.empty();}
        bool is_absolute() const {return !_path.empty() && _path[0] == '/';}

        char operator[](size_t offset) const
        {
            return _path.at(offset);
        }

        const char* c_str() const
        {
            return _path.c_str();
        }
        operator const char*() const
        {
            return c_str();
        }

        // Decomposes the path into its constituent parts.  If the path is
        // absolute, the first part will be "/".
        std::vector<std::string> decompose() const
        {
            std::vector<std::string> v;
            if (_path.empty())
                return v;
            if (_path[0] == '/')
                v.push_back("/");

            std::string component;
            bool last_was_slash = true;
            for (char c : _path)
            {
                if (c == '/')
                {
                    if (!last_was_slash)
                    {
                        v.push_back(component);
                        component.clear();
                    }
                }
                else
                    component += c;
                last_was_slash = (c == '/');
            }
            if (!component.empty())
                v.push_back(component);

            return v;
        }

        // Inverse of decompose().
        static path compose(const std::vector<std::string>& parts)
        {
            std::string s;
            size_t i = 0;
            if (!parts.empty() && parts[0] == "/")
            {
                s = "/";
                i = 1;
            }
            for (size_t j = i; j < parts.size(); ++j)
            {
                if (j != i)
                    s += '/';
                s += parts[j];
            }
            return path(s);
        }

        // Lexically normalizes the path: repeated slashes and "." components
        // are removed, as is any trailing slash.  ".." components are kept
        // since resolving them requires knowledge of symlinks.
        path normalize() const
        {
            std::vector<std::string> parts;
            for (auto& c : decompose())
            {
                if (c != ".")
                    parts.push_back(c);
            }
            if (parts.empty())
                return path(_path.empty() ? "" : ".");
            return compose(parts);
        }

        // Returns the normalized absolute form of the path, prefixing the
        // current working directory to relative paths.
        path absolute() const
        {
            if (is_absolute())
                return normalize();
            return path(futil::getcwd(),*this).normalize();
        }

        // Returns the containing directory, or an empty path if there is
        // none (the root directory or a single relative component).
        path parent() const
        {
            auto parts = normalize().decompose();
            if (parts.size() <= 1)
                return path("");
            parts.pop_back();
            return compose(parts);
        }

        // Returns the last component, or an empty string for the root.
        std::string name() const
        {
            auto parts = decompose();
            if (parts.empty() || parts.back() == "/")
                return "";
            return parts.back();
        }

        // Replaces the extension of the last component with ext, or appends
        // it if there is no extension.  A leading dot does not start an
        // extension, so ".profile" becomes ".profile.ext".
        path with_extension(const std::string& ext) const
        {
            std::string n = name();
            size_t pos = n.rfind('.');
            if (pos != std::string::npos && pos != 0)
                n.resize(pos);
            n += "." + ext;

            path p = parent();
            if (p.empty())
                return path(n);
            return p + path(n);
        }

        // Returns true if other lies strictly beneath this path.  The test is
        // component-wise so "/a/b" is not an ancestor of "/a/bc".
        bool is_ancestor_of(const path& other) const
        {
            auto a = decompose();
            auto b = other.decompose();
            if (a.size() >= b.size())
                return false;
            return std::equal(a.begin(),a.end(),b.begin());
        }

        inline futil::path
        operator+(const futil::path& rhs) const
        {
            if (rhs._path.empty())
                return *this;
            if (rhs[0] == '/')
                throw futil::invalid_join_exception();
            if (_path.empty())
                return rhs;
            if (_path[_path.size() - 1] == '/')
                return futil::path(_path + rhs._path);
            return futil::path(_path + "/" + rhs._path);
        }

        path() {}

        path(const char* _path):
            _path(_path)
        {
        }

        path(const std::string& _path):
            _path(_path)
        {
        }

        template<typename ...T>
        path(const path& _path, T... tail):
            _path((_path + ... + tail))
        {
        }
    };

    struct file_descriptor
    {
        int fd;

        void close()
        {
            if (fd == -1)
                return;

            try
            {
                futil::close(fd);
                fd = -1;
            }
            catch (const futil::errno_exception&)
            {
                // If we failed to close with anything other than EINTR, the
                // file descriptor is left in an unspecified state so you
                // cannot do ANYTHING with it.
                fd = -1;
            }
        }

        void fsync() const
        {
            // Pushes dirty data out to the disk controller.  On macOS, this
            // doesn't flush to the disk itself; the dirty data could sit in
            // disk buffers.
            futil::fsync(fd);
        }

        constexpr file_descriptor():fd(-1) {}

        constexpr file_descriptor(int fd):fd(fd) {}

        file_descriptor(const file_descriptor&) = delete;

        file_descriptor(file_descriptor&& other):
            fd(other.fd)
        {
            other.fd = -1;
        }

        ~file_descriptor()
        {
            close();
        }
    };

    struct directory : public file_descriptor
    {
        std::vector<std::string> _listdir(uint32_t mask) const
        {
            int search_fd = futil::openat(fd,".",O_DIRECTORY);

            std::vector<std::string> dirs;
            auto* dirp = futil::fdopendir(search_fd);
            struct dirent* dp;
            while ((dp = futil::readdir(dirp)) != NULL)
            {
                if (!(mask & (1ULL << dp->d_type)))
                    continue;
                if (dp->d_name[0] == '.')
                {
                    if (dp->d_name[1] == '\0')
                        continue;
                    if (dp->d_name[1] == '.' && dp->d_name[2] == '\0')
                        continue;
                }

                dirs.push_back(dp->d_name);
            }

            futil::closedir(dirp);

            return dirs;
        }

        inline std::vector<std::string> listall() const
        {
            return _listdir(-1);
        }

        directory(const path& p):
            file_descriptor(futil::open(p,O_DIRECTORY | O_RDONLY))
        {
        }

        directory(int at_fd, const path& p):
            file_descriptor(futil::openat(at_fd,p,O_DIRECTORY | O_RDONLY))
        {
        };

        directory(const directory& d, const path& p):
            directory(d.fd,p)
        {
        }
    };

    struct file : public file_descriptor
    {
        void openat(int dir_fd, const path& p, int oflag)
        {
            close();
            if (oflag & O_CREAT)
                throw inconsistent_file_params();
            fd = futil::openat(dir_fd,p,oflag);
        }

        void openat(int dir_fd, const path& p, int oflag, mode_t mode)
        {
            close();
            if (!(oflag & O_CREAT))
                throw inconsistent_file_params();
            fd = futil::openat(dir_fd,p,oflag,mode);
        }

        void open(const path& p, int oflag)
        {
            openat(AT_FDCWD,p,oflag);
        }

        void open(const path& p, int oflag, mode_t mode)
        {
            openat(AT_FDCWD,p,oflag,mode);
        }

        void open(const directory& d, const path& p, int oflag)
        {
            openat(d.fd,p,oflag);
        }

        void open(const directory& d, const path& p, int oflag, mode_t mode)
        {
            openat(d.fd,p,oflag,mode);
        }

        size_t read_all_or_eof(void* _p, size_t n)
        {
            auto* p = (char*)_p;
            while (n)
            {
                ssize_t v = futil::read(fd,p,n);
                if (v == 0)
                    break;
                p += v;
                n -= v;
            }
            return p - (char*)_p;
        }

        // Reads from the current position up to the end of the file.
        std::string read_to_eof()
        {
            std::string s;
            char buf[4096];
            for (;;)
            {
                size_t n = read_all_or_eof(buf,sizeof(buf));
                s.append(buf,n);
                if (n < sizeof(buf))
                    return s;
            }
        }

        struct line
        {
            std::string text;
            bool eof;

            operator bool() const {return !eof;}
        };

        line read_line(char terminator = '\n') const
        {
            // Reads lines, separated by the specified terminator string.
            // Strips the terminator string from the return value.
            std::string line;
            for (;;)
            {
                char c;
                ssize_t v = futil::read(fd,&c,1);
                if (v == 0)
                    return {line,true};

                if (c == terminator)
                    return {line,false};

                line += c;
            }
        }

        void write_all(const void* _p, size_t n) const
        {
            auto* p = (const char*)_p;
            while (n)
            {
                ssize_t v = futil::write(fd,p,n);
                p += v;
                n -= v;
            }
        }

        constexpr file() {}

        file(const path& p, int oflag)
        {
            open(p,oflag);
        }

        file(const path& p, int oflag, mode_t mode)
        {
            open(p,oflag,mode);
        }

        file(const directory& d, const path& p, int oflag)
        {
            open(d,p,oflag);
        }

        file(const directory& d, const path& p, int oflag, mode_t mode)
        {
            open(d,p,oflag,mode);
        }

    protected:
        file(int fd):file_descriptor(fd) {}
    };

    inline void mkdir(const directory& dir, const char* path, mode_t mode)
    {
        futil::mkdirat(dir.fd,path,mode);
    }

    inline void unlink(const directory& dir, const char* path)
    {
        futil::unlinkat(dir.fd,path,0);
    }

    inline void rename(const directory& old_dir, const char* old,
                       const directory& new_dir, const char* _new)
    {
        // Renames to the target location, atomically overwriting whatever was
        // there to begin with.
        futil::renameat(old_dir.fd,old,new_dir.fd,_new);
    }

    // Renames to the target location, as long as the target doesn't exist.
    // Returns true if the rename was successful, false if the target already
    // existed, otherwise throws an exception upon error.
    inline bool rename_if_not_exists(const path& old, const path& _new)
    {
        return futil::renameat_if_not_exists(AT_FDCWD,old,AT_FDCWD,_new);
    }

    // Returns true if something exists at the path.  Symlinks are not
    // followed, so a dangling symlink exists.
    inline bool exists(const path& p)
    {
        struct stat st;
        return futil::fstatat_if_exists(AT_FDCWD,p,&st,AT_SYMLINK_NOFOLLOW);
    }

    // Returns the metadata of the path itself, not following symlinks.
    inline struct stat lstat(const path& p)
    {
        struct stat st;
        futil::fstatat(AT_FDCWD,p,&st,AT_SYMLINK_NOFOLLOW);
        return st;
    }

    inline futil::path
    operator+(const std::string& lhs, const futil::path& rhs)
    {
        return futil::path(lhs,rhs);
    }

    inline futil::path
    operator+(const char* lhs, const futil::path& rhs)
    {
        return futil::path(lhs,rhs);
    }
}

#endif /* __SRC_FUTIL_FUTIL_H */
