// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#include "fakefs.h"
#include "../futil_wrap.h"
#include <strutil/strutil.h>
#include <hdr/kassert.h>
#include <algorithm>
#include <iterator>
#include <dirent.h>

struct ffs_DIR
{
    int at_fd;
    dir_node* dn;
    struct dirent de;
    std::map<std::string,file_node*>::iterator files_iter;
    size_t special_iter;
    std::map<std::string,dir_node*>::iterator subdirs_iter;

    ffs_DIR(int at_fd,dir_node* dn):
        at_fd(at_fd),
        dn(dn),
        files_iter(dn->files.begin()),
        special_iter(0),
        subdirs_iter(dn->subdirs.begin())
    {
    }
};

struct resolved_path
{
    dir_node*   directory;
    std::string name;
};

dir_node* fs_root = new dir_node{NULL,"",0,1,true};
std::vector<dir_node*> snapshots;
std::set<dir_node*> live_dirs{fs_root};
std::set<file_node*> live_files;
fake_fd fd_table[128];
std::map<std::string,int> rename_faults;
std::map<std::string,std::string> stat_races;
static dir_node* current_wd = fs_root;

// Symlinks are only followed in the final component by fstatat().  Opening
// a symlink fails with ELOOP.
static constexpr size_t MAX_SYMLINK_DEPTH = 8;

static int
find_free_fd()
{
    for (size_t i=1; i<std::size(fd_table); ++i)
    {
        if (fd_table[i].type == FDT_FREE)
            return i;
    }
    throw futil::errno_exception(ENFILE);
}

static dir_node*
find_at_fd_dir_node(int at_fd)
{
    if (at_fd == AT_FDCWD)
        return current_wd;
    if (at_fd >= (int)std::size(fd_table) || at_fd <= 0)
        throw futil::errno_exception(EBADF);
    if (fd_table[at_fd].type != FDT_DIRECTORY)
        throw futil::errno_exception(EBADF);
    return fd_table[at_fd].directory;
}

static file_node*
find_fd_file_node(int fd)
{
    if (fd >= (int)std::size(fd_table) || fd <= 0)
        throw futil::errno_exception(EBADF);
    if (fd_table[fd].type != FDT_FILE)
        throw futil::errno_exception(EBADF);
    return fd_table[fd].file;
}

static resolved_path
resolve_path(dir_node* base_dir, const std::string& path)
{
    if (path.empty())
        return resolved_path{base_dir,""};
    if (path[0] == '/')
        base_dir = fs_root;
    auto parts = str::split(path,"/");
    for (size_t i=0; i<parts.size() - 1; ++i)
    {
        if (parts[i].empty() || parts[i] == ".")
            continue;
        if (parts[i] == "..")
        {
            base_dir = base_dir->parent ?: base_dir;
            continue;
        }
        auto iter = base_dir->subdirs.find(parts[i]);
        if (iter == base_dir->subdirs.end())
        {
            if (base_dir->files.contains(parts[i]))
                throw futil::errno_exception(ENOTDIR);
            throw futil::errno_exception(ENOENT);
        }
        base_dir = iter->second;
    }

    auto& name = parts[parts.size() - 1];
    if (name.empty() || name == ".")
        return resolved_path{base_dir,""};
    if (name == "..")
        return resolved_path{base_dir->parent ?: base_dir,""};
    return resolved_path{base_dir,name};
}

static void
release_file(file_node* fn)
{
    if (!--fn->refcount)
    {
        kassert(live_files.contains(fn));
        live_files.erase(fn);
        delete fn;
    }
}

static void
release_dir(dir_node* dn)
{
    if (!--dn->refcount)
    {
        kassert(live_dirs.contains(dn));
        live_dirs.erase(dn);
        delete dn;
    }
}

void
futil::fsync(int fd)
{
    if (fd >= (int)std::size(fd_table) || fd <= 0)
        throw futil::errno_exception(EBADF);
    switch (fd_table[fd].type)
    {
        case FDT_DIRECTORY:
            for (auto &[name, fn] : fd_table[fd].directory->files)
                fn->meta_fsynced = true;
            for (auto &[name, dn] : fd_table[fd].directory->subdirs)
                dn->meta_fsynced = true;
            fd_table[fd].directory->dirty_unlinks.clear();
        break;

        case FDT_FILE:
            fd_table[fd].file->data_fsynced = true;
        break;

        case FDT_FREE:
            throw futil::errno_exception(EBADF);
    }
}

void
futil::close(int fd)
{
    if (fd >= (int)std::size(fd_table) || fd <= 0)
        throw futil::errno_exception(EBADF);
    if (fd_table[fd].type == FDT_FILE)
    {
        release_file(fd_table[fd].file);
        fd_table[fd].file = NULL;
    }
    else if (fd_table[fd].type == FDT_DIRECTORY)
    {
        release_dir(fd_table[fd].directory);
        fd_table[fd].directory = NULL;
    }
    else
        throw futil::errno_exception(EBADF);
    fd_table[fd].type = FDT_FREE;
}

int
futil::openat(int at_fd, const char* path, int oflag)
{
    kassert(!(oflag & O_APPEND));
    kassert(!(oflag & O_CREAT));
    kassert(!(oflag & O_EXCL));
    kassert(!(oflag & O_TRUNC));

    dir_node* at_dir = find_at_fd_dir_node(at_fd);
    auto rp = resolve_path(at_dir,path);
    int fd = find_free_fd();

    if (rp.name.empty())
    {
        fd_table[fd].type      = FDT_DIRECTORY;
        fd_table[fd].pos       = 0;
        fd_table[fd].directory = rp.directory;
        ++fd_table[fd].directory->refcount;
        return fd;
    }

    auto diter = rp.directory->subdirs.find(rp.name);
    if (diter != rp.directory->subdirs.end())
    {
        fd_table[fd].type      = FDT_DIRECTORY;
        fd_table[fd].pos       = 0;
        fd_table[fd].directory = diter->second;
        ++fd_table[fd].directory->refcount;
        return fd;
    }

    auto fiter = rp.directory->files.find(rp.name);
    if (fiter != rp.directory->files.end())
    {
        if (fiter->second->symlink)
            throw futil::errno_exception(ELOOP);
        if (oflag & O_DIRECTORY)
            throw futil::errno_exception(ENOTDIR);
        fd_table[fd].type = FDT_FILE;
        fd_table[fd].pos  = 0;
        fd_table[fd].file = fiter->second;
        ++fd_table[fd].file->refcount;
        return fd;
    }

    throw futil::errno_exception(ENOENT);
}

int
futil::openat(int at_fd, const char* path, int oflag, mode_t mode)
{
    kassert(!(oflag & O_APPEND));
    kassert(oflag & O_CREAT);
    kassert(!(oflag & O_DIRECTORY));

    dir_node* at_dir = find_at_fd_dir_node(at_fd);
    auto rp = resolve_path(at_dir,path);
    int fd = find_free_fd();

    if (rp.name.empty() || rp.directory->subdirs.contains(rp.name))
        throw futil::errno_exception(EISDIR);

    // Find it if it exists, create it if it doesn't.
    file_node* fn;
    auto iter = rp.directory->files.find(rp.name);
    if (iter == rp.directory->files.end())
    {
        fn = new file_node{rp.directory,rp.name,mode,1,false,true,false};
        rp.directory->files.emplace(std::make_pair(rp.name,fn));
        ++rp.directory->refcount;
        live_files.insert(fn);
    }
    else if (oflag & O_EXCL)
        throw futil::errno_exception(EEXIST);
    else if (iter->second->symlink)
        throw futil::errno_exception(ELOOP);
    else
        fn = iter->second;

    if ((oflag & O_TRUNC) && !fn->data.empty())
    {
        fn->data_fsynced = false;
        fn->data.clear();
    }

    fd_table[fd].type = FDT_FILE;
    fd_table[fd].pos  = 0;
    fd_table[fd].file = fn;
    ++fn->refcount;

    return fd;
}

int
futil::openat_if_exists(int at_fd, const char* path, int oflag)
{
    try
    {
        return futil::openat(at_fd,path,oflag);
    }
    catch (const futil::errno_exception& e)
    {
        if (e.errnov == ENOENT)
            return -1;
        throw;
    }
}

DIR*
futil::fdopendir(int at_fd)
{
    auto dn = find_at_fd_dir_node(at_fd);
    return reinterpret_cast<DIR*>(new ffs_DIR(at_fd,dn));
}

struct dirent*
futil::readdir(DIR* _dirp)
{
    auto dirp = reinterpret_cast<ffs_DIR*>(_dirp);
    if (dirp->files_iter != dirp->dn->files.end())
    {
        auto* fn = dirp->files_iter->second;
        memset(&dirp->de,0,sizeof(dirp->de));
        dirp->de.d_type = fn->symlink ? DT_LNK : DT_REG;
        snprintf(dirp->de.d_name,sizeof(dirp->de.d_name),"%s",
                 fn->name.c_str());
        ++dirp->files_iter;
        return &dirp->de;
    }
    if (dirp->special_iter < 2)
    {
        memset(&dirp->de,0,sizeof(dirp->de));
        dirp->de.d_type = DT_DIR;
        snprintf(dirp->de.d_name,sizeof(dirp->de.d_name),"%s",
                 dirp->special_iter == 0 ? "." : "..");
        ++dirp->special_iter;
        return &dirp->de;
    }
    if (dirp->subdirs_iter != dirp->dn->subdirs.end())
    {
        auto* dn = dirp->subdirs_iter->second;
        memset(&dirp->de,0,sizeof(dirp->de));
        dirp->de.d_type = DT_DIR;
        snprintf(dirp->de.d_name,sizeof(dirp->de.d_name),"%s",
                 dn->name.c_str());
        ++dirp->subdirs_iter;
        return &dirp->de;
    }
    return NULL;
}

void
futil::closedir(DIR* _dirp)
{
    auto dirp = reinterpret_cast<ffs_DIR*>(_dirp);
    int at_fd = dirp->at_fd;
    delete dirp;
    futil::close(at_fd);
}

int
futil::open(const char* path, int oflag)
{
    return futil::openat(AT_FDCWD,path,oflag);
}

ssize_t
futil::read(int fd, void* buf, size_t nbyte)
{
    file_node* file = find_fd_file_node(fd);
    if (fd_table[fd].pos >= (off_t)file->data.size())
        return 0;

    size_t limit = file->data.size() - fd_table[fd].pos;
    nbyte = std::min(nbyte,limit);
    memcpy(buf,&file->data[fd_table[fd].pos],nbyte);
    fd_table[fd].pos += nbyte;
    return nbyte;
}

ssize_t
futil::write(int fd, const void* buf, size_t nbyte)
{
    file_node* fn = find_fd_file_node(fd);

    // Zero-length writes do not extend the file length, even if the position
    // is past the end of the file.
    if (!nbyte)
        return 0;

    size_t limit = fd_table[fd].pos + nbyte;
    if (fn->data.size() < limit)
        fn->data.resize(limit);
    memcpy(&fn->data[fd_table[fd].pos],buf,nbyte);
    fn->data_fsynced = false;
    fd_table[fd].pos += nbyte;
    return nbyte;
}

void
futil::mkdirat(int at_fd, const char* path, mode_t mode)
{
    dir_node* at_dir = find_at_fd_dir_node(at_fd);
    auto rp = resolve_path(at_dir,path);

    if (rp.name.empty())
        throw futil::errno_exception(EEXIST);
    if (rp.directory->subdirs.contains(rp.name) ||
        rp.directory->files.contains(rp.name))
    {
        throw futil::errno_exception(EEXIST);
    }

    auto dn = new dir_node{rp.directory,rp.name,mode,1,false};
    dn->parent->subdirs.emplace(std::make_pair(dn->name,dn));
    ++dn->parent->refcount;
    live_dirs.insert(dn);
}

void
futil::mkdir(const char* path, mode_t mode)
{
    futil::mkdirat(AT_FDCWD,path,mode);
}

bool
futil::mkdirat_if_not_exists(int at_fd, const char* path, mode_t mode) try
{
    futil::mkdirat(at_fd,path,mode);
    return true;
}
catch (const futil::errno_exception& e)
{
    if (e.errnov == EEXIST)
        return false;
    throw;
}

bool
futil::mkdir_if_not_exists(const char* path, mode_t mode)
{
    return futil::mkdirat_if_not_exists(AT_FDCWD,path,mode);
}

void
futil::symlink(const char* path1, const char* path2)
{
    auto rp = resolve_path(current_wd,path2);
    if (rp.name.empty() ||
        rp.directory->subdirs.contains(rp.name) ||
        rp.directory->files.contains(rp.name))
    {
        throw futil::errno_exception(EEXIST);
    }

    auto fn = new file_node{rp.directory,rp.name,0777,1,true,true,false};
    fn->set_data(path1);
    rp.directory->files.emplace(std::make_pair(rp.name,fn));
    ++rp.directory->refcount;
    live_files.insert(fn);
}

void
futil::unlinkat(int at_fd, const char* path, int flag)
{
    dir_node* at_dir = find_at_fd_dir_node(at_fd);
    auto rp = resolve_path(at_dir,path);
    if (flag & AT_REMOVEDIR)
    {
        // Removing the root!
        if (rp.name.empty() && !rp.directory->parent)
            throw futil::errno_exception(EBUSY);

        dir_node* rem_dir;
        if (rp.name.empty())
            rem_dir = rp.directory;
        else if (rp.directory->subdirs.contains(rp.name))
            rem_dir = rp.directory->subdirs[rp.name];
        else if (rp.directory->files.contains(rp.name))
            throw futil::errno_exception(ENOTDIR);
        else
            throw futil::errno_exception(ENOENT);

        if (!rem_dir->subdirs.empty() || !rem_dir->files.empty())
            throw futil::errno_exception(ENOTEMPTY);

        kassert(rem_dir->parent);
        kassert(--rem_dir->parent->refcount);
        rem_dir->parent->subdirs.erase(rem_dir->name);
        rem_dir->parent->dirty_unlinks.insert(rem_dir->name);
        rem_dir->meta_fsynced = false;
        release_dir(rem_dir);
    }
    else
    {
        if (rp.name.empty())
            throw futil::errno_exception(EISDIR);
        if (rp.directory->subdirs.contains(rp.name))
            throw futil::errno_exception(EISDIR);

        auto iter = rp.directory->files.find(rp.name);
        if (iter == rp.directory->files.end())
            throw futil::errno_exception(ENOENT);

        file_node* rem_file = iter->second;
        kassert(rem_file->parent);
        kassert(--rem_file->parent->refcount);
        rem_file->parent->files.erase(rem_file->name);
        rem_file->parent->dirty_unlinks.insert(rem_file->name);
        rem_file->meta_fsynced = false;
        release_file(rem_file);
    }
}

void
futil::unlink(const char* path)
{
    futil::unlinkat(AT_FDCWD,path,0);
}

void
futil::unlinkat_if_exists(int at_fd, const char* path, int flag) try
{
    futil::unlinkat(at_fd,path,flag);
}
catch (const futil::errno_exception& e)
{
    if (e.errnov != ENOENT)
        throw;
}

void
futil::unlink_if_exists(const char* path)
{
    futil::unlinkat_if_exists(AT_FDCWD,path,0);
}

void
futil::renameat(int fromfd, const char* from, int tofd, const char* to)
{
    auto fault = rename_faults.find(from);
    if (fault != rename_faults.end())
        throw futil::errno_exception(fault->second);

    auto fromdn = find_at_fd_dir_node(fromfd);
    auto todn   = find_at_fd_dir_node(tofd);
    auto fromrp = resolve_path(fromdn,from);
    auto torp   = resolve_path(todn,to);
    if (fromrp.name.empty() || torp.name.empty())
        throw futil::errno_exception(EBUSY);

    if (fromrp.directory->subdirs.contains(fromrp.name))
    {
        // Moving a directory.
        if (torp.directory->files.contains(torp.name))
            throw futil::errno_exception(ENOTDIR);
        auto dn = fromrp.directory->subdirs[fromrp.name];

        // Make sure the new location is not a subdirectory of the from
        // directory.
        for (auto tdn = torp.directory; tdn != NULL; tdn = tdn->parent)
        {
            if (tdn == dn)
                throw futil::errno_exception(EINVAL);
        }

        // Remove the target directory if it exists and is empty.
        auto iter = torp.directory->subdirs.find(torp.name);
        if (iter != torp.directory->subdirs.end())
        {
            auto rem_dir = iter->second;
            if (dn == rem_dir)
                return;
            if (!rem_dir->files.empty() || !rem_dir->subdirs.empty())
                throw futil::errno_exception(ENOTEMPTY);
            kassert(--torp.directory->refcount);
            torp.directory->subdirs.erase(rem_dir->name);
            torp.directory->dirty_unlinks.insert(rem_dir->name);
            rem_dir->meta_fsynced = false;
            release_dir(rem_dir);
        }

        // Move the source directory to the target.
        kassert(--fromrp.directory->refcount);
        fromrp.directory->subdirs.erase(fromrp.name);
        fromrp.directory->dirty_unlinks.insert(fromrp.name);
        dn->name = torp.name;
        dn->parent = torp.directory;
        dn->meta_fsynced = false;
        torp.directory->subdirs.insert(std::make_pair(dn->name,dn));
        ++torp.directory->refcount;
    }
    else if (fromrp.directory->files.contains(fromrp.name))
    {
        // Moving a file or symlink.
        if (torp.directory->subdirs.contains(torp.name))
            throw futil::errno_exception(EISDIR);
        auto fn = fromrp.directory->files[fromrp.name];

        // Remove the target file if it exists; the rename overwrites it.
        auto iter = torp.directory->files.find(torp.name);
        if (iter != torp.directory->files.end())
        {
            auto rem_file = iter->second;
            if (fn == rem_file)
                return;
            kassert(--torp.directory->refcount);
            torp.directory->files.erase(rem_file->name);
            torp.directory->dirty_unlinks.insert(rem_file->name);
            rem_file->meta_fsynced = false;
            release_file(rem_file);
        }

        // Move the source file to the target.
        kassert(--fromrp.directory->refcount);
        fromrp.directory->files.erase(fromrp.name);
        fromrp.directory->dirty_unlinks.insert(fromrp.name);
        fn->name = torp.name;
        fn->parent = torp.directory;
        fn->meta_fsynced = false;
        torp.directory->files.insert(std::make_pair(fn->name,fn));
        ++torp.directory->refcount;
    }
    else
        throw futil::errno_exception(ENOENT);
}

bool
futil::renameat_if_not_exists(int fromfd, const char* from, int tofd,
    const char* to)
{
    auto fault = rename_faults.find(from);
    if (fault != rename_faults.end())
        throw futil::errno_exception(fault->second);

    auto todn = find_at_fd_dir_node(tofd);
    auto torp = resolve_path(todn,to);
    if (torp.name.empty())
        throw futil::errno_exception(EBUSY);
    if (torp.directory->files.contains(torp.name) ||
        torp.directory->subdirs.contains(torp.name))
    {
        return false;
    }

    futil::renameat(fromfd,from,tofd,to);
    return true;
}

void
futil::rename(const char* old, const char* _new)
{
    futil::renameat(AT_FDCWD,old,AT_FDCWD,_new);
}

void
futil::fstatat(int at_fd, const char* path, struct stat* st, int flag)
{
    dir_node* at_dir = find_at_fd_dir_node(at_fd);
    std::string p(path);
    for (size_t depth = 0; depth < MAX_SYMLINK_DEPTH; ++depth)
    {
        auto rp = resolve_path(at_dir,p);
        memset(st,0,sizeof(*st));
        st->st_nlink = 1;

        dir_node* dn = NULL;
        if (rp.name.empty())
            dn = rp.directory;
        else
        {
            auto diter = rp.directory->subdirs.find(rp.name);
            if (diter != rp.directory->subdirs.end())
                dn = diter->second;
        }
        if (dn)
        {
            st->st_mode = S_IFDIR | (dn->mode & 07777);
            st->st_ino  = (ino_t)(uintptr_t)dn;
            return;
        }

        auto fiter = rp.directory->files.find(rp.name);
        if (fiter == rp.directory->files.end())
            throw futil::errno_exception(ENOENT);

        file_node* fn = fiter->second;
        if (fn->symlink && !(flag & AT_SYMLINK_NOFOLLOW))
        {
            at_dir = rp.directory;
            p      = fn->data_as_string();
            continue;
        }

        st->st_mode = (fn->symlink ? S_IFLNK : S_IFREG) | (fn->mode & 07777);
        st->st_size = fn->data.size();
        st->st_ino  = (ino_t)(uintptr_t)fn;
        return;
    }
    throw futil::errno_exception(ELOOP);
}

bool
futil::fstatat_if_exists(int at_fd, const char* path, struct stat* st,
    int flag)
{
    bool found = true;
    try
    {
        futil::fstatat(at_fd,path,st,flag);
    }
    catch (const futil::errno_exception& e)
    {
        if (e.errnov != ENOENT && e.errnov != ENOTDIR)
            throw;
        found = false;
    }

    auto race = stat_races.find(path);
    if (race != stat_races.end())
    {
        auto contents = race->second;
        stat_races.erase(race);
        make_file(path,contents);
    }
    return found;
}

std::string
futil::getcwd()
{
    auto s = current_wd->path();
    if (s.size() > 1)
        s.pop_back();
    return s;
}

dir_node*
make_dirs(const std::string& path)
{
    std::string built;
    if (!path.empty() && path[0] == '/')
        built = "/";
    for (auto& c : str::split(path,"/"))
    {
        if (c.empty())
            continue;
        built += c;
        futil::mkdirat_if_not_exists(AT_FDCWD,built.c_str(),0755);
        built += "/";
    }
    dir_node* dn = find_dir(path);
    kassert(dn != NULL);
    return dn;
}

file_node*
make_file(const std::string& path, const std::string& contents)
{
    size_t pos = path.rfind('/');
    if (pos != std::string::npos && pos != 0)
        make_dirs(path.substr(0,pos));

    int fd = futil::openat(AT_FDCWD,path.c_str(),O_RDWR | O_CREAT | O_EXCL,
                           0644);
    futil::write(fd,contents.data(),contents.size());
    futil::close(fd);
    return find_file(path);
}

file_node*
make_symlink(const std::string& path, const std::string& target)
{
    size_t pos = path.rfind('/');
    if (pos != std::string::npos && pos != 0)
        make_dirs(path.substr(0,pos));

    futil::symlink(target.c_str(),path.c_str());
    return find_file(path);
}

file_node*
find_file(const std::string& path)
{
    try
    {
        auto rp = resolve_path(current_wd,path);
        auto iter = rp.directory->files.find(rp.name);
        return iter == rp.directory->files.end() ? NULL : iter->second;
    }
    catch (const futil::errno_exception&)
    {
        return NULL;
    }
}

dir_node*
find_dir(const std::string& path)
{
    try
    {
        auto rp = resolve_path(current_wd,path);
        if (rp.name.empty())
            return rp.directory;
        auto iter = rp.directory->subdirs.find(rp.name);
        return iter == rp.directory->subdirs.end() ? NULL : iter->second;
    }
    catch (const futil::errno_exception&)
    {
        return NULL;
    }
}

void
delete_tree(dir_node* dn)
{
    while (!dn->subdirs.empty())
        delete_tree(dn->subdirs.begin()->second);

    while (!dn->files.empty())
    {
        auto iter = dn->files.begin();
        auto fn = iter->second;
        dn->files.erase(fn->name);
        kassert(--dn->refcount);
        release_file(fn);
    }

    if (dn->parent)
    {
        dn->parent->subdirs.erase(dn->name);
        kassert(--dn->parent->refcount);
    }

    release_dir(dn);
}

dir_node*
clone_tree(dir_node* dn)
{
    dir_node* new_dn = new dir_node{NULL,dn->name,dn->mode,1,dn->meta_fsynced,
                                    dn->dirty_unlinks};
    live_dirs.insert(new_dn);

    for (auto const &[name, fn] : dn->files)
    {
        file_node* new_fn = new file_node{new_dn,fn->name,fn->mode,1,
                                          fn->symlink,fn->data_fsynced,
                                          fn->meta_fsynced,fn->data};
        new_dn->files.emplace(std::make_pair(new_fn->name,new_fn));
        ++new_dn->refcount;
        live_files.insert(new_fn);
    }

    for (auto const &[name, subdn] : dn->subdirs)
    {
        dir_node* new_subdn = clone_tree(subdn);
        new_subdn->parent = new_dn;
        new_dn->subdirs.emplace(std::make_pair(new_subdn->name,new_subdn));
        ++new_dn->refcount;
    }

    return new_dn;
}

bool
trees_equal(const dir_node* a, const dir_node* b)
{
    // Compares names, types and contents.  Sync state and modes are ignored.
    if (a->files.size() != b->files.size() ||
        a->subdirs.size() != b->subdirs.size())
    {
        return false;
    }

    for (auto const &[name, fn] : a->files)
    {
        auto iter = b->files.find(name);
        if (iter == b->files.end())
            return false;
        if (iter->second->symlink != fn->symlink ||
            iter->second->data != fn->data)
        {
            return false;
        }
    }

    for (auto const &[name, subdn] : a->subdirs)
    {
        auto iter = b->subdirs.find(name);
        if (iter == b->subdirs.end())
            return false;
        if (!trees_equal(subdn,iter->second))
            return false;
    }

    return true;
}

void
fsync_tree(dir_node* dn)
{
    dn->meta_fsynced = true;
    dn->dirty_unlinks.clear();

    for (auto iter : dn->subdirs)
        fsync_tree(iter.second);
    for (auto iter : dn->files)
    {
        iter.second->data_fsynced = true;
        iter.second->meta_fsynced = true;
    }
}

static bool
is_tree_fsynced(dir_node* dn, bool check_root)
{
    if (check_root && (!dn->meta_fsynced || !dn->dirty_unlinks.empty()))
        return false;

    for (auto iter : dn->subdirs)
    {
        if (!is_tree_fsynced(iter.second,true))
            return false;
    }
    for (auto iter : dn->files)
    {
        if (!iter.second->data_fsynced)
            return false;
        if (!iter.second->meta_fsynced)
            return false;
    }

    return true;
}

static void
print_not_fsynced(dir_node* dn, bool print_root)
{
    auto dirname = dn->path();
    if (print_root)
    {
        if (!dn->meta_fsynced)
            printf("%s not meta-fsynced.\n",dirname.c_str());
        for (const auto& s : dn->dirty_unlinks)
            printf("%s dirty unlink \"%s\".\n",dirname.c_str(),s.c_str());
    }

    for (auto iter : dn->files)
    {
        auto fname = dirname + iter.first;
        if (!iter.second->data_fsynced)
            printf("%s not data-fsynced.\n",fname.c_str());
        if (!iter.second->meta_fsynced)
            printf("%s not meta-fsynced.\n",fname.c_str());
    }
    for (auto iter : dn->subdirs)
        print_not_fsynced(iter.second,true);
}

void
assert_tree_fsynced(dir_node* dn)
{
    if (is_tree_fsynced(dn,true))
        return;
    print_not_fsynced(dn,true);
    kabort();
}

void
snapshot_fs()
{
    snapshots.push_back(clone_tree(fs_root));
}

void
snapshot_reset()
{
    for (auto* dn : snapshots)
        delete_tree(dn);
    snapshots.clear();
}
