// Copyright (c) 2025 by Terry Greeniaus.
// All rights reserved.
#ifndef __SRC_FUTIL_FAKEFS_FAKEFS_H
#define __SRC_FUTIL_FAKEFS_FAKEFS_H

#include <hdr/kassert.h>
#include <sys/types.h>
#include <string.h>
#include <string>
#include <vector>
#include <map>
#include <set>

struct file_node;

struct dir_node
{
    dir_node*                           parent;
    std::string                         name;
    mode_t                              mode;
    size_t                              refcount;
    bool                                meta_fsynced;
    std::set<std::string>               dirty_unlinks;
    std::map<std::string,file_node*>    files;
    std::map<std::string,dir_node*>     subdirs;

    file_node* get_file(const std::string& name) const
    {
        auto iter = files.find(name);
        kassert(iter != files.end());
        return iter->second;
    }

    dir_node* get_dir(const std::string& name) const
    {
        auto iter = subdirs.find(name);
        kassert(iter != subdirs.end());
        return iter->second;
    }

    std::string path() const
    {
        if (!parent)
            return "/";
        return parent->path() + name + "/";
    }
};

// Regular files and symlinks both live in dir_node::files.  A symlink keeps
// its target in data.
struct file_node
{
    dir_node*               parent;
    std::string             name;
    mode_t                  mode;
    size_t                  refcount;
    bool                    symlink;
    bool                    data_fsynced;
    bool                    meta_fsynced;
    std::vector<uint8_t>    data;

    std::string data_as_string() const
    {
        return std::string(data.begin(),data.end());
    }
    void set_data(const std::string& s)
    {
        data.assign(s.begin(),s.end());
    }

    std::string path() const
    {
        return parent->path() + name;
    }
};

enum fd_type
{
    FDT_FREE,
    FDT_FILE,
    FDT_DIRECTORY,
};

struct fake_fd
{
    fd_type     type = FDT_FREE;
    off_t       pos = 0;
    union
    {
        file_node*  file;
        dir_node*   directory;
    };
};

// Test helpers for building and inspecting trees.  Paths are resolved
// relative to the fake current working directory.
extern file_node* make_file(const std::string& path,
                            const std::string& contents = "");
extern file_node* make_symlink(const std::string& path,
                               const std::string& target);
extern dir_node* make_dirs(const std::string& path);
extern file_node* find_file(const std::string& path);
extern dir_node* find_dir(const std::string& path);

extern void delete_tree(dir_node* dn);
extern dir_node* clone_tree(dir_node* dn);
extern bool trees_equal(const dir_node* a, const dir_node* b);
extern void fsync_tree(dir_node* dn);
extern void assert_tree_fsynced(dir_node* dn);
extern void snapshot_fs();
extern void snapshot_reset();

extern dir_node* fs_root;
extern std::vector<dir_node*> snapshots;
extern std::set<dir_node*> live_dirs;
extern std::set<file_node*> live_files;
extern fake_fd fd_table[128];

// Makes any rename whose source path is spelled exactly as the key fail with
// the mapped errno value.
extern std::map<std::string,int> rename_faults;

// After the next existence check of a path spelled exactly as the key,
// creates a file there holding the mapped contents.  Fires once.
extern std::map<std::string,std::string> stat_races;

#endif /* __SRC_FUTIL_FAKEFS_FAKEFS_H */
